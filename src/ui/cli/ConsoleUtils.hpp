#ifndef CHUNKVAULT_UI_CLI_CONSOLEUTILS_HPP
#define CHUNKVAULT_UI_CLI_CONSOLEUTILS_HPP

#include "chunkvault/security/SecureString.hpp"
#include <string>

namespace chunkvault::ui::cli
{

// Keeps key material out of swap and core dumps.
void lockProcessMemory() noexcept;

[[nodiscard]] chunkvault::security::SecureString readPassphrase(const std::string& prompt);

} // namespace chunkvault::ui::cli

#endif // CHUNKVAULT_UI_CLI_CONSOLEUTILS_HPP
