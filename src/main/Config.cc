#include "main/Config.hh"

#include "IoUtility.hh"
#include "Logging.hh"

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <new>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace WarCheck {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto PLAYER_NUMBERS = "player_numbers"sv;
constexpr auto MAX_CARDS = "max_cards"sv;
constexpr auto LOG_LEVEL = "log_level"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Exceptions must not cross the Lua C boundary
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
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            std::strerror(errno));
        throw std::runtime_error {"Failed to read config"};
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
    if (success) {
        return static_cast<int>(ret);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

std::optional<std::set<int>> getIntSet(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (!lua_istable(lua, -1)) {
        if (!lua_isnoneornil(lua, -1)) {
            log(LogLevel::WARNING, "Expected array: %s", key);
        }
        return std::nullopt;
    }
    auto ret = std::set<int> {};
    for (auto i = 1;; ++i) {
        lua_rawgeti(lua, -1, i);
        LuaPopGuard guard2 {lua};
        if (lua_isnil(lua, -1)) {
            break;
        }
        auto success = 0;
        const auto value = lua_tointegerx(lua, -1, &success);
        if (!success) {
            log(LogLevel::WARNING, "%s: expected element %d to be integer",
                key, i);
            return std::nullopt;
        }
        ret.insert(static_cast<int>(value));
    }
    return ret;
}

}

struct Config::Impl {
    Impl() = default;
    explicit Impl(std::istream& in);

    Validation::ClassifierConfig classifierConfig {};
    std::optional<LogLevel> logLevel {};
};

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    if (auto player_numbers = getIntSet(lua.get(), PLAYER_NUMBERS)) {
        classifierConfig.playerNumbers = std::move(*player_numbers);
    }
    if (const auto max_cards = getInt(lua.get(), MAX_CARDS)) {
        if (*max_cards >= 0) {
            classifierConfig.maxCards = *max_cards;
        } else {
            log(LogLevel::WARNING, "Expected non-negative integer: %s",
                MAX_CARDS);
        }
    }

    if (const auto log_level = getString(lua.get(), LOG_LEVEL)) {
        logLevel = logLevelFromString(*log_level);
        if (!logLevel) {
            log(LogLevel::WARNING, "Unknown log level: %s", *log_level);
        }
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

const Validation::ClassifierConfig& Config::getClassifierConfig() const
{
    if (!impl) {
        throw std::logic_error {"Accessing moved-from config"};
    }
    return impl->classifierConfig;
}

std::optional<LogLevel> Config::getLogLevel() const
{
    if (!impl) {
        throw std::logic_error {"Accessing moved-from config"};
    }
    return impl->logLevel;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
