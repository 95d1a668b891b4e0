#include "arincdelta/schemas.hpp"

namespace arincdelta::schemas {

namespace {

class LocalizerSchema : public RecordSchema {
public:
    LocalizerSchema()
        : RecordSchema(SchemaDescriptor{
              "PI",
              {"P", "I"},
              22,
              23,
              {
                  {"record_type", ColumnRange{1, 1}},
                  {"area_code", ColumnRange{2, 4}},
                  {"sec", ColumnRange{5, 5}},
                  {"icao", ColumnRange{7, 10}},
                  {"icao_code", ColumnRange{11, 12}},
                  {"sub", ColumnRange{13, 13}},
                  {"localizer_identifier", ColumnRange{14, 17}},
                  {"ils_category", ColumnRange{18, 18}},
                  {"localizer_frequency", ColumnRange{23, 27}},
                  {"runway_identifier", ColumnRange{28, 32}},
                  {"localizer_latitude", ColumnRange{33, 41}},
                  {"localizer_longitude", ColumnRange{42, 51}},
                  {"localizer_bearing", ColumnRange{52, 55}},
                  {"glide_slope_latitude", ColumnRange{56, 64}},
                  {"glide_slope_longitude", ColumnRange{65, 74}},
                  {"localizer_position", ColumnRange{75, 78}},
                  {"localizer_position_reference", ColumnRange{79, 79}},
                  {"glide_slope_position", ColumnRange{80, 83}},
                  {"localizer_width", ColumnRange{84, 87}},
                  {"glide_slope_angle", ColumnRange{88, 90}},
                  {"station_declination", ColumnRange{91, 95}},
                  {"glide_slope_height_lthr", ColumnRange{96, 97}},
                  {"glide_slope_elevation", ColumnRange{98, 102}},
                  {"supporting_facility_id", ColumnRange{103, 106}},
                  {"supporting_facility_icao", ColumnRange{107, 108}},
                  {"supporting_facility_section", ColumnRange{109, 109}},
                  {"supporting_facility_subsection", ColumnRange{110, 110}},
                  {"primary_1_123", std::nullopt},
              }}) {}

    void postprocess(Row& row) const override {
        clip_ident(row, "localizer_identifier");
    }
};

} // anonymous namespace

std::unique_ptr<RecordSchema> make_localizer_schema() {
    return std::make_unique<LocalizerSchema>();
}

} // namespace arincdelta::schemas
