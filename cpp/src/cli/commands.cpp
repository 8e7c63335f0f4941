#include "ferry/cli/commands.hpp"

#include <cstring>

namespace ferry::cli {
    namespace {
        [[nodiscard]] ferry::core::Status cli_invalid(u32 aux = 0) noexcept {
            return ferry::core::make_status(ferry::core::StatusDomain::Cli, ferry::core::StatusCode::Invalid, aux);
        }
    } // namespace

    ferry::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_invalid(1);
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return cli_invalid(2);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return ferry::core::ok_status();
            }
        }
        return cli_invalid(3);
    }
} // namespace ferry::cli
