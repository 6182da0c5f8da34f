#include "wkt/doc_util.hpp"
#include "wkt/common.hpp"

#include "duckdb/catalog/catalog.hpp"
#include "duckdb/catalog/catalog_entry/scalar_function_catalog_entry.hpp"
#include "duckdb/catalog/catalog_entry/schema_catalog_entry.hpp"
#include "duckdb/common/limits.hpp"

namespace wkt {

static bool IsBlank(const string &line) {
	return line.find_first_not_of(" \t\r") == string::npos;
}

string DocUtil::Dedent(const char *text) {
	if (!text) {
		return string();
	}
	const string input(text);

	vector<string> lines;
	idx_t line_start = 0;
	while (line_start <= input.size()) {
		auto line_end = input.find('\n', line_start);
		if (line_end == string::npos) {
			line_end = input.size();
		}
		lines.push_back(input.substr(line_start, line_end - line_start));
		line_start = line_end + 1;
	}

	auto indent = NumericLimits<idx_t>::Maximum();
	for (auto &line : lines) {
		if (!IsBlank(line)) {
			indent = MinValue<idx_t>(indent, line.find_first_not_of(" \t"));
		}
	}

	string result;
	for (idx_t i = 0; i < lines.size(); i++) {
		if (i > 0) {
			result += '\n';
		}
		if (!IsBlank(lines[i])) {
			result += lines[i].substr(indent);
		}
	}

	result.erase(0, result.find_first_not_of('\n'));
	result.erase(result.find_last_not_of(" \n\r\t") + 1);
	return result;
}

void DocUtil::AddDocumentation(DatabaseInstance &db, const FunctionDoc &doc) {
	auto &system_catalog = Catalog::GetSystemCatalog(db);
	auto transaction = CatalogTransaction::GetSystemTransaction(db);
	auto &schema = system_catalog.GetSchema(transaction, DEFAULT_SCHEMA);
	auto entry = schema.GetEntry(transaction, CatalogType::SCALAR_FUNCTION_ENTRY, doc.name);
	if (!entry) {
		throw InternalException("Cannot document \"%s\", the function is not registered", doc.name);
	}

	auto &function = entry->Cast<FunctionEntry>();
	function.description = Dedent(doc.description);
	function.example = Dedent(doc.example);
	function.tags["ext"] = "wkt";
	if (doc.category) {
		function.tags["category"] = doc.category;
	}
}

} // namespace wkt
