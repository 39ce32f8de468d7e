#include "mycore/text.hpp"
#include "myhttp/headers.hpp"

namespace ShelfHttpd::Http {
    auto to_header_case(std::string_view name) -> std::string {
        std::string result;
        result.reserve(name.length());

        auto at_segment_start = true;

        for (const auto c : name) {
            if (c == '-') {
                result.push_back(c);
                at_segment_start = true;
                continue;
            }

            result.push_back(at_segment_start ? Core::to_ascii_upper(c) : Core::to_ascii_lower(c));
            at_segment_start = false;
        }

        return result;
    }
}
