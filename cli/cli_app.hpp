/**
 * @file cli_app.hpp
 * @brief aclink CLI entry point, callable with any pair of streams.
 */

#ifndef ACLINK_CLI_APP_HPP
#define ACLINK_CLI_APP_HPP

#include <ostream>

namespace aclink {
namespace cli {

/**
 * @brief Parse argv and run one subcommand.
 *
 * Results go to @p out, log lines and errors to @p err.
 *
 * @retval 0 ok
 * @retval 1 message rejected or envelope dropped
 * @retval 2 bad input or config
 */
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace aclink

#endif // ACLINK_CLI_APP_HPP
