#ifndef CLI_HPP
#define CLI_HPP

#include <ostream>
#include <string>
#include <vector>

/**
 * @file cli.hpp
 * @brief Entry point of the keytree-derive command-line tool.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /// Process exit codes of keytree-derive.
    enum ExitCode {
        ExitOk = 0,
        ExitUsage = 1,
        ExitDerivation = 2
    };

    /**
     * @brief Runs keytree-derive with @p args (program name excluded).
     *
     * Usage: keytree-derive [--config FILE] [--public] <seed-hex> [path]
     *
     * Key information goes to @p out; diagnostics and log entries go to
     * @p err unless KEYTREE_LOG_PATH names a log file. The configuration file
     * (default ".env") selects the backend, hint, HMAC key and log settings.
     *
     * @return ExitOk, ExitUsage for bad arguments or settings, or
     * ExitDerivation when the key cannot be derived.
     */
    int runDerive(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace Keytree

#endif // CLI_HPP
