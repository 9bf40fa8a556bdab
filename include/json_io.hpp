#pragma once

#include "fragment.hpp"
#include "pipeline.hpp"
#include "profile.hpp"
#include "score_domain.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace tablestitch {

// Ingestion document: { "fragments": [ {page, table_index, data, source} ],
// "page_texts": [...], "context": {...} }. Throws InputError when malformed.
DocumentInput parseDocumentInput(const nlohmann::json& doc);
DocumentInput loadDocumentInput(const std::string& path);

Fragment parseFragment(const nlohmann::json& j, size_t position);

nlohmann::json toJson(const ScoreDomain& domain);
nlohmann::json toJson(const LogicalTable& table);
nlohmann::json toJson(const DocumentMetadata& metadata);
nlohmann::json toJson(const ConversionResult& result);

// Overlays the keys present in `j` onto `options`; absent keys keep their value.
void applyOptions(const nlohmann::json& j, ConversionOptions& options);
void loadOptionsFile(const std::string& path, ConversionOptions& options);

} // namespace tablestitch
