#include "ferry/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace ferry::cli {
    namespace {
        [[nodiscard]] ferry::core::Status cli_invalid() noexcept {
            return ferry::core::make_status(ferry::core::StatusDomain::Cli, ferry::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
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
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return true;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
                case OptionType::Flag:
                    break;
            }
            return false;
        }

        [[nodiscard]] ferry::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return ferry::core::ok_status();
        }
    } // namespace

    ferry::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
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
            const char* value = nullptr;   // inline value: --name=value or -xvalue
            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[64]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return cli_invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            ++i;
            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
            } else {
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i++];
                }
                if (!set_value(*spec, value, &opt)) {
                    return cli_invalid();
                }
            }

            const ferry::core::Status s = push_option(out, opt);
            if (!ferry::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return ferry::core::ok_status();
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
} // namespace ferry::cli
