#pragma once

#include "registry.hpp"

#include <memory>

namespace arincdelta::schemas {

// PG - airport runway
std::unique_ptr<RecordSchema> make_runway_schema();

// PI - localizer / glide slope
std::unique_ptr<RecordSchema> make_localizer_schema();

// PV - airport communications
std::unique_ptr<RecordSchema> make_airport_comm_schema();

// DV - VHF navaid, split into ILS/DME and VOR views
std::unique_ptr<RecordSchema> make_vhf_navaid_schema();

// Shared row cleanup helpers
void trim_field(Row& row, const std::string& name);
void clip_ident(Row& row, const std::string& name, size_t width = 4);

} // namespace arincdelta::schemas
