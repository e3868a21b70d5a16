#pragma once
#include <schema/transaction.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace har {

// Import of captured browser traffic in HAR 1.2 format.

/**
 * @brief Read transactions from a HAR file
 * @param path Path to a .har file
 * @return One transaction per usable entry, in file order
 * @throws std::runtime_error if the file cannot be opened or is not JSON
 */
std::vector<Transaction> load_file(const std::string& path);

/**
 * @brief Convert a parsed HAR document to transactions
 *
 * Entries without a request URL are skipped with a warning. Response bodies
 * with content.encoding "base64" are decoded.
 *
 * @param doc Parsed HAR document ({"log": {"entries": [...]}})
 * @return Transactions in entry order
 * @throws std::runtime_error if the document has no log.entries array
 */
std::vector<Transaction> from_json(const nlohmann::json& doc);

/**
 * @brief Convert one HAR entry
 * @throws std::invalid_argument if the entry has no request URL
 */
Transaction entry_to_transaction(const nlohmann::json& entry);

} // namespace har
