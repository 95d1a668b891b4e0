#include "arincdelta/schemas.hpp"

namespace arincdelta::schemas {

namespace {

class RunwaySchema : public RecordSchema {
public:
    RunwaySchema()
        : RecordSchema(SchemaDescriptor{
              "PG",
              {"P", "G"},
              22,
              23,
              {
                  {"area_code", ColumnRange{2, 4}},
                  {"icao", ColumnRange{7, 10}},
                  {"runway_id", ColumnRange{14, 18}},
                  {"rwy_length_ft", ColumnRange{23, 27}},
                  {"rwy_mag_brg_tenths", ColumnRange{28, 31}},
                  {"lat_raw", ColumnRange{33, 41}},
                  {"lon_raw", ColumnRange{42, 51}},
                  {"rwy_grad_pct100", ColumnRange{52, 56}},
                  {"lthr_elev_ft", ColumnRange{67, 71}},
                  {"dthr_ft", ColumnRange{72, 75}},
                  {"tch_raw", ColumnRange{76, 77}},
                  {"rwy_width_ft", ColumnRange{78, 80}},
                  {"loc_mls_gls_ident", ColumnRange{82, 85}},
                  {"primary_1_123", std::nullopt},
              }}) {}

    void postprocess(Row& row) const override {
        clip_ident(row, "loc_mls_gls_ident");
    }
};

} // anonymous namespace

std::unique_ptr<RecordSchema> make_runway_schema() {
    return std::make_unique<RunwaySchema>();
}

} // namespace arincdelta::schemas
