#include "tagcache/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace tagcache::cli {
    namespace {
        using tagcache::core::Status;

        [[nodiscard]] Status invalid() noexcept {
            return tagcache::core::make_status(tagcache::core::StatusDomain::Cli, tagcache::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Builds the option for `spec`. `inline_value` is the text after '='
        // or after a short name; otherwise the value is taken from the next
        // argument. Advances *i past what was used.
        [[nodiscard]] Status take_option(const CliArgs& args, const OptionSpec& spec,
                                         const char* inline_value, u32* i,
                                         ParsedOption* out) noexcept {
            out->id = spec.id;
            out->type = spec.type;

            if (spec.type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                out->value.boolv = 1;
                *i += 1;
                return tagcache::core::ok_status();
            }

            const char* value = inline_value;
            if (value == nullptr) {
                if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                    return invalid();
                }
                value = args.argv[*i + 1];
                *i += 2;
            } else {
                *i += 1;
            }

            if (spec.type == OptionType::String) {
                out->value.str = value;
                return tagcache::core::ok_status();
            }
            if (spec.type == OptionType::I64 && parse_i64(value, &out->value.i64v)) {
                return tagcache::core::ok_status();
            }
            return invalid();
        }
    } // namespace

    tagcache::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                inline_value = eq != nullptr ? eq + 1 : nullptr;
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                inline_value = tok[2] != '\0' ? tok + 2 : nullptr;
            }
            if (spec == nullptr) {
                return invalid();
            }

            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            ParsedOption opt{};
            const Status s = take_option(args, *spec, inline_value, &i, &opt);
            if (!tagcache::core::is_ok(s)) {
                return s;
            }
            out->data[out->len++] = opt;
        }

        *consumed = i;
        return tagcache::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    bool has_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* o = find_option(opts, id);
        return o != nullptr && o->type == OptionType::Flag && o->value.boolv != 0;
    }
} // namespace tagcache::cli
