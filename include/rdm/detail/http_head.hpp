#pragma once

#include "rdm/http_client.hpp"

#include <string_view>

namespace rdm::detail {

// Feeds one raw header line (status line or "Name: value") into head.
// A status line starts a new head, discarding what redirects left behind.
void parseHeaderLine(std::string_view line, ResponseHead& head);

// Parses "bytes <first>-<last>/<total>". Leaves head untouched on mismatch.
bool parseContentRange(std::string_view value, ResponseHead& head);

// Throws TransferError unless the final head is 2xx, or carries no status
// at all (file:// and other non-HTTP schemes).
void requireSuccessStatus(const ResponseHead& head, std::string_view url);

} // namespace rdm::detail
