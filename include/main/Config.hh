/** \file
 *
 * \brief Definition of WarCheck::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "validation/LineClassifier.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace WarCheck {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration is a Lua script. After running the script, the following
 * global variables are read:
 *
 * - \c player_numbers: array of player numbers accepted by the line grammar
 * - \c max_cards: the largest card count accepted in game winner lines
 * - \c log_level: the name of the logging level (see logLevelFromString())
 *
 * Variables that are missing, or have a value of wrong type, keep their
 * default values.
 */
class Config {
public:

    /** \brief Create default configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    explicit Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the parameters of the line classifier
     */
    const Validation::ClassifierConfig& getClassifierConfig() const;

    /** \brief Get the logging level
     *
     * \return the logging level named in the configuration, or none if the
     * configuration does not name one
     */
    std::optional<LogLevel> getLogLevel() const;

private:

    struct Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 *
 * \throw std::runtime_error if reading or processing the configuration fails
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
