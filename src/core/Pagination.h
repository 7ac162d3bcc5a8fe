#pragma once
#include "Errors.h"
#include <optional>
#include <set>
#include <string>
#include <cstddef>

namespace cloud_audit {

// Walks a token-paginated listing to exhaustion.
// fetch(const std::optional<std::string>& token) returns a page with `items`
// and `next_token`; visit is called for each item in page order.
// A continuation token seen twice means the listing would never end: CollectionError.
template <class Fetch, class Visit>
std::size_t paginate(Fetch&& fetch, Visit&& visit) {
    std::optional<std::string> token;
    std::set<std::string> seen;
    std::size_t pages = 0;
    do {
        auto page = fetch(token);
        ++pages;
        for(const auto& item : page.items) visit(item);
        token = page.next_token;
        if(token && token->empty()) token.reset();
        if(token && !seen.insert(*token).second)
            throw CollectionError("pagination token repeated after " + std::to_string(pages) + " pages");
    } while(token);
    return pages;
}

}
