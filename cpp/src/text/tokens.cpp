#include "tagcache/text/tokens.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <utility>

namespace tagcache::text {
    namespace {
        constexpr std::array<std::string_view, 4> kTableMarkers = {
            "FROM", "JOIN", "INTO", "UPDATE",
        };

        constexpr std::string_view kQuoteChars = "[]`'\"";

        [[nodiscard]] bool is_separator(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                const auto ca = static_cast<unsigned char>(a[i]);
                const auto cb = static_cast<unsigned char>(b[i]);
                if (std::toupper(ca) != std::toupper(cb)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] bool is_table_marker(std::string_view token) noexcept {
            for (std::string_view marker : kTableMarkers) {
                if (iequals(token, marker)) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
                s.remove_prefix(1);
            }
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
                s.remove_suffix(1);
            }
            return s;
        }
    } // namespace

    std::vector<std::string_view> split_tokens(std::string_view text) {
        std::vector<std::string_view> tokens;
        std::size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && is_separator(text[i])) {
                ++i;
            }
            const std::size_t start = i;
            while (i < text.size() && !is_separator(text[i])) {
                ++i;
            }
            if (i > start) {
                tokens.push_back(text.substr(start, i - start));
            }
        }
        return tokens;
    }

    std::string normalize_identifier(std::string_view token) {
        // Non-empty dot segments; only the first two matter.
        std::array<std::string_view, 2> parts{};
        std::size_t part_count = 0;
        std::size_t pos = 0;
        while (pos <= token.size() && part_count < parts.size()) {
            const std::size_t dot = token.find('.', pos);
            const std::size_t end = dot == std::string_view::npos ? token.size() : dot;
            if (end > pos) {
                parts[part_count++] = token.substr(pos, end - pos);
            }
            if (dot == std::string_view::npos) {
                break;
            }
            pos = dot + 1;
        }

        std::string_view picked;
        if (part_count == 1) {
            picked = trim(parts[0]);
        } else if (part_count >= 2) {
            picked = trim(parts[1]);
        }

        std::string out;
        out.reserve(picked.size());
        for (char c : picked) {
            if (kQuoteChars.find(c) == std::string_view::npos) {
                out.push_back(c);
            }
        }
        if (trim(out).empty()) {
            out.clear();
        }
        return out;
    }

    core::ResourceSet extract_candidate_identifiers(std::string_view text) {
        core::ResourceSet candidates;
        const std::vector<std::string_view> tokens = split_tokens(text);

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (!is_table_marker(tokens[i])) {
                continue;
            }
            ++i;
            if (i >= tokens.size()) {
                break;
            }
            std::string name = normalize_identifier(tokens[i]);
            if (!name.empty()) {
                candidates.insert(std::move(name));
            }
        }
        return candidates;
    }
} // namespace tagcache::text
