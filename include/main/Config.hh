/** \file
 *
 * \brief Definition of Trio::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace Trio {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. It is executed in a fresh Lua state
 * and the options are read from the global variables it leaves behind.
 *
 * | Global           | Type    | Default | Meaning                          |
 * |------------------|---------|---------|----------------------------------|
 * | bind_address     | string  | "*"     | interface of the control socket  |
 * | bind_base_port   | integer | 5555    | port of the control socket       |
 * | min_players      | integer | 3       | seats needed to start a game     |
 * | max_players      | integer | 6       | seats in a room                  |
 * | fail_delay_ms    | integer | 2500    | delay before failed cards return |
 *
 * The seat limits are clamped so that 3 <= min_players <= max_players <= 6.
 * A negative delay is replaced by zero. A global of the wrong type is ignored
 * with a warning.
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

    Config(Config&&);

    ~Config();

    Config& operator=(Config&&);

    /** \brief Get the endpoint the control socket binds to
     *
     * \return TCP endpoint formed from the bind address and base port, e.g.
     * “tcp://*:5555”
     *
     * \sa \ref trioprotocol
     */
    std::string getControlEndpoint() const;

    /** \brief Get the minimum number of seats needed to start a game
     */
    int getMinPlayers() const;

    /** \brief Get the maximum number of seats in a room
     */
    int getMaxPlayers() const;

    /** \brief Get the time the cards of a failed sequence stay revealed
     */
    std::chrono::milliseconds getFailDelay() const;

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
 * \throw std::runtime_error if the file cannot be opened or processed
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
