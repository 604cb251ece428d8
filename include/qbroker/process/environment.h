#pragma once

#include <map>
#include <span>
#include <string>
#include <vector>

namespace qbroker::process {

using Environment = std::map<std::string, std::string>;

/**
 * @brief Snapshot of the current process environment (environ).
 */
Environment captureEnvironment();

/**
 * @brief Copy of @p base without the credential-shadowing variables.
 *
 * Removing the ambient API key is what forces the CLI onto its own stored login
 * instead of metered API billing. Pure: @p base is never modified.
 */
Environment sanitizeEnvironment(const Environment& base, std::span<const std::string> shadowed);

/**
 * @brief Flatten to "KEY=VALUE" strings suitable for building an envp array.
 */
std::vector<std::string> toEnvStrings(const Environment& env);

/**
 * @brief Resolve @p name against PATH from @p env (absolute/relative paths are checked as-is).
 * @return Empty string when no executable candidate exists
 */
std::string resolveExecutable(const std::string& name, const Environment& env);

} // namespace qbroker::process
