#include "tagcache/text/classifier.hpp"

#include <array>
#include <cctype>
#include <cstddef>

namespace tagcache::text {
    namespace {
        constexpr std::array<std::string_view, 4> kMutatingVerbs = {
            "insert ", "update ", "delete ", "create ",
        };

        [[nodiscard]] bool is_space(char c) noexcept {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && is_space(s.front())) {
                s.remove_prefix(1);
            }
            while (!s.empty() && is_space(s.back())) {
                s.remove_suffix(1);
            }
            return s;
        }

        [[nodiscard]] bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept {
            if (s.size() < prefix.size()) {
                return false;
            }
            for (std::size_t i = 0; i < prefix.size(); ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (static_cast<char>(std::tolower(c)) != prefix[i]) {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    bool is_mutating_command(std::string_view text) noexcept {
        if (trim(text).empty()) {
            return false;
        }

        while (!text.empty()) {
            const std::size_t nl = text.find('\n');
            const std::string_view line = trim(text.substr(0, nl));
            for (std::string_view verb : kMutatingVerbs) {
                if (starts_with_icase(line, verb)) {
                    return true;
                }
            }
            if (nl == std::string_view::npos) {
                break;
            }
            text.remove_prefix(nl + 1);
        }
        return false;
    }

    bool is_mutating_command(const char* text) noexcept {
        if (text == nullptr) {
            return false;
        }
        return is_mutating_command(std::string_view{text});
    }
} // namespace tagcache::text
