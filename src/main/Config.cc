#include "main/Config.hh"

#include "trio/TrioConstants.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <new>
#include <optional>
#include <sstream>
#include <stdexcept>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Trio {
namespace Main {

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

constexpr auto BIND_ADDRESS = "bind_address"sv;
constexpr auto BIND_BASE_PORT = "bind_base_port"sv;
constexpr auto MIN_PLAYERS_KEY = "min_players"sv;
constexpr auto MAX_PLAYERS_KEY = "max_players"sv;
constexpr auto FAIL_DELAY_MS = "fail_delay_ms"sv;

const auto DEFAULT_BIND_ADDRESS = "*"s;
constexpr auto DEFAULT_BIND_BASE_PORT = 5555;
constexpr auto DEFAULT_FAIL_DELAY = std::chrono::milliseconds {2500};

class LuaPopGuard {
public:
    explicit LuaPopGuard(lua_State* lua) : lua {lua} {}
    ~LuaPopGuard() { lua_pop(lua, 1); }
private:
    lua_State* lua;
};

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    explicit LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Exceptions may not cross the C boundary
            log(LogLevel::WARNING, "Failed to read config: %s",
                std::strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (!s) {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
    auto error = lua_load(
        lua, config_lua_reader, reader_args.get(), "config", nullptr);
    if (!error) {
        // Lua reports allocation failures with longjmp
        const auto out_of_memory_handler = std::set_new_handler(std::terminate);
        error = lua_pcall(lua, 0, 0, 0);
        std::set_new_handler(out_of_memory_handler);
    }
    if (error) {
        log(LogLevel::ERROR, "Error while running config script: %s",
            lua_tostring(lua, -1));
        throw std::runtime_error {"Could not process config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

std::optional<int> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success && lua_type(lua, -1) == LUA_TNUMBER) {
        return static_cast<int>(ret);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

}

struct Config::Impl {

    Impl();
    explicit Impl(std::istream& in);

    std::string bindAddress {DEFAULT_BIND_ADDRESS};
    int bindBasePort {DEFAULT_BIND_BASE_PORT};
    int minPlayers {MIN_PLAYERS};
    int maxPlayers {MAX_PLAYERS};
    std::chrono::milliseconds failDelay {DEFAULT_FAIL_DELAY};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    if (!lua) {
        throw std::runtime_error {"Could not create Lua state"};
    }
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    bindAddress = getString(lua.get(), BIND_ADDRESS).value_or(bindAddress);
    bindBasePort = getInt(lua.get(), BIND_BASE_PORT).value_or(bindBasePort);
    minPlayers = std::clamp(
        getInt(lua.get(), MIN_PLAYERS_KEY).value_or(minPlayers),
        MIN_PLAYERS, MAX_PLAYERS);
    maxPlayers = std::clamp(
        getInt(lua.get(), MAX_PLAYERS_KEY).value_or(maxPlayers),
        minPlayers, MAX_PLAYERS);
    if (const auto fail_delay = getInt(lua.get(), FAIL_DELAY_MS)) {
        failDelay = std::chrono::milliseconds {std::max(*fail_delay, 0)};
    }

    log(LogLevel::INFO, "Reading configs completed");
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

std::string Config::getControlEndpoint() const
{
    assert(impl);
    std::ostringstream os;
    os << "tcp://" << impl->bindAddress << ':' << impl->bindBasePort;
    return os.str();
}

int Config::getMinPlayers() const
{
    assert(impl);
    return impl->minPlayers;
}

int Config::getMaxPlayers() const
{
    assert(impl);
    return impl->maxPlayers;
}

std::chrono::milliseconds Config::getFailDelay() const
{
    assert(impl);
    return impl->failDelay;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    }
    errno = 0;
    return processStreamFromPath(path, [](auto& in) { return Config {in}; });
}

}
}
