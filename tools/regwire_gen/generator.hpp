#pragma once

#include "regwire/core/catalog.hpp"
#include "regwire/core/pipeline.hpp"

#include <chrono>
#include <string>

namespace regwire_gen {

std::string dump_catalog_summary(const regwire::catalog& cat);
std::string dump_run_summary(const regwire::run_output& out);

// "YYYY-MM-DD HH:MM:SS UTC"
std::string format_generation_time(std::chrono::system_clock::time_point tp);

} // namespace regwire_gen
