#include "arincdelta/schemas.hpp"

namespace arincdelta::schemas {

namespace {

// Continuation number sits in column 26 for this type
class AirportCommSchema : public RecordSchema {
public:
    AirportCommSchema()
        : RecordSchema(SchemaDescriptor{
              "PV",
              {"P", "V"},
              26,
              27,
              {
                  {"area_code", ColumnRange{2, 4}},
                  {"blank_6", ColumnRange{6, 6}},
                  {"icao", ColumnRange{7, 10}},
                  {"icao_code", ColumnRange{11, 12}},
                  {"communications_type", ColumnRange{14, 16}},
                  {"communications_frequency", ColumnRange{17, 23}},
                  {"guard_transmit", ColumnRange{24, 24}},
                  {"frequency_units", ColumnRange{25, 25}},
                  {"cont_no_column_26", ColumnRange{26, 26}},
                  {"service_indicator", ColumnRange{27, 29}},
                  {"radar_service", ColumnRange{30, 30}},
                  {"modulation", ColumnRange{31, 31}},
                  {"signal_emission", ColumnRange{32, 32}},
                  {"latitude", ColumnRange{33, 41}},
                  {"longitude", ColumnRange{42, 51}},
                  {"magnetic_variation", ColumnRange{52, 56}},
                  {"facility_elevation", ColumnRange{57, 61}},
                  {"h24_indicator", ColumnRange{62, 62}},
                  {"sectorization", ColumnRange{63, 68}},
                  {"altitude_description", ColumnRange{69, 69}},
                  {"communication_altitude_1", ColumnRange{70, 74}},
                  {"communication_altitude_2", ColumnRange{75, 79}},
                  {"sector_facility", ColumnRange{80, 83}},
                  {"sector_facility_icao", ColumnRange{84, 85}},
                  {"sector_facility_section", ColumnRange{86, 86}},
                  {"sector_facility_subsection", ColumnRange{87, 87}},
                  {"distance_description", ColumnRange{88, 88}},
                  {"communications_distance", ColumnRange{89, 90}},
                  {"remote_facility", ColumnRange{91, 94}},
                  {"remote_facility_icao", ColumnRange{95, 96}},
                  {"remote_facility_section", ColumnRange{97, 97}},
                  {"remote_facility_subsection", ColumnRange{98, 98}},
                  {"call_sign", ColumnRange{99, 123}},
                  {"primary_1_123", std::nullopt},
              }}) {}

    void postprocess(Row& row) const override {
        trim_field(row, "communications_type");
        trim_field(row, "communications_frequency");
        trim_field(row, "call_sign");
    }
};

} // anonymous namespace

std::unique_ptr<RecordSchema> make_airport_comm_schema() {
    return std::make_unique<AirportCommSchema>();
}

} // namespace arincdelta::schemas
