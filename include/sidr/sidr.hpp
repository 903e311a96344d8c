#pragma once

// sidr - Windows Search database forensic reporter
// Main include file

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>
#include <sidr/types.hpp>

#include <sidr/storage/page.hpp>
#include <sidr/storage/page_reader.hpp>
#include <sidr/storage/btree.hpp>
#include <sidr/storage/catalog.hpp>
#include <sidr/storage/record.hpp>
#include <sidr/storage/long_value.hpp>
#include <sidr/storage/ese_database.hpp>

#include <sidr/sqlite/sqlite_reader.hpp>

#include <sidr/report/report.hpp>
#include <sidr/search/artifact_mapper.hpp>
#include <sidr/search/windows_search.hpp>
#include <sidr/search/scanner.hpp>

#include <sidr/util/logger.hpp>

namespace sidr {

// Version reported by sidr --version
constexpr const char* VERSION = "0.1.0";

}  // namespace sidr
