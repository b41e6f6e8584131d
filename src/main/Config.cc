#include "main/Config.hh"

#include "IoUtility.hh"
#include "Utility.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Whoopie {
namespace Main {

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

constexpr auto MAX_PLAYERS_KEY = "max_players"sv;
constexpr auto MIN_PLAYERS_TO_START_KEY = "min_players_to_start"sv;
constexpr auto IS_PUBLIC_KEY = "is_public"sv;
constexpr auto ALLOW_SPECTATORS_KEY = "allow_spectators"sv;
constexpr auto SEED_KEY = "seed"sv;
constexpr auto STANZAS_KEY = "stanzas"sv;
constexpr auto PLAYERS_KEY = "players"sv;

constexpr auto PLAYER_ID = "id"sv;
constexpr auto PLAYER_NAME = "name"sv;
constexpr auto PLAYER_TYPE = "type"sv;
constexpr auto PLAYER_DIFFICULTY = "difficulty"sv;

const auto PLAYER_TYPE_HUMAN = "human"s;
const auto PLAYER_TYPE_AI = "ai"s;

constexpr auto DEFAULT_NUMBER_OF_PLAYERS = 4;

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
            // Would throw exception here but this is extern "C"...
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
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
            // Just for the duration of executing lots and lots of C
            // code... let's just die if out of memory instead of handling the
            // exception
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
        log(LogLevel::ERROR, "Bad stream while reading config: %s", strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

[[noreturn]] void failWrongType(
    const std::string_view key, const std::string_view expected)
{
    log(LogLevel::ERROR, "Expected %s: %s", expected, key);
    throw std::runtime_error {"Invalid type in config: " + std::string {key}};
}

// Each getter reads the value at the top of the stack. None means nil.

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    if (lua_isnoneornil(lua, -1)) {
        return std::nullopt;
    } else if (lua_type(lua, -1) != LUA_TSTRING) {
        failWrongType(key, "string");
    }
    return lua_tostring(lua, -1);
}

std::optional<lua_Integer> getInt(lua_State* lua, std::string_view key)
{
    if (lua_isnoneornil(lua, -1)) {
        return std::nullopt;
    }
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (!success) {
        failWrongType(key, "integer");
    }
    return ret;
}

std::optional<bool> getBool(lua_State* lua, std::string_view key)
{
    if (lua_isnoneornil(lua, -1)) {
        return std::nullopt;
    } else if (!lua_isboolean(lua, -1)) {
        failWrongType(key, "boolean");
    }
    return lua_toboolean(lua, -1);
}

template<typename Getter>
auto getGlobal(lua_State* lua, std::string_view key, Getter&& getter)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    return getter(lua, key);
}

template<typename Getter>
auto getField(lua_State* lua, std::string_view key, Getter&& getter)
{
    lua_pushlstring(lua, key.data(), key.size());
    lua_rawget(lua, -2);
    LuaPopGuard guard {lua};
    return getter(lua, key);
}

Player getPlayer(lua_State* lua, const int n)
{
    if (!lua_istable(lua, -1)) {
        failWrongType(PLAYERS_KEY, "table of players");
    }
    const auto default_id = boost::format("player%1%") % n;
    const auto default_name = boost::format("Player %1%") % n;
    auto id = getField(lua, PLAYER_ID, getString).value_or(default_id.str());
    auto name =
        getField(lua, PLAYER_NAME, getString).value_or(default_name.str());
    const auto type =
        getField(lua, PLAYER_TYPE, getString).value_or(PLAYER_TYPE_HUMAN);
    if (type == PLAYER_TYPE_HUMAN) {
        return HumanPlayer {std::move(id), std::move(name), true};
    } else if (type == PLAYER_TYPE_AI) {
        auto difficulty = AiDifficulty::BEGINNER;
        if (const auto difficulty_string =
            getField(lua, PLAYER_DIFFICULTY, getString)) {
            const auto iter =
                AI_DIFFICULTY_TO_STRING_MAP.right.find(*difficulty_string);
            if (iter == AI_DIFFICULTY_TO_STRING_MAP.right.end()) {
                log(LogLevel::ERROR, "Unknown AI difficulty: %s",
                    *difficulty_string);
                throw std::runtime_error {"Invalid AI difficulty in config"};
            }
            difficulty = iter->second;
        }
        return AiPlayer {std::move(id), std::move(name), difficulty};
    }
    log(LogLevel::ERROR, "Unknown player type: %s", type);
    throw std::runtime_error {"Invalid player type in config"};
}

std::vector<Player> getDefaultPlayers()
{
    auto ret = std::vector<Player> {};
    for (const auto n : from_to(1, DEFAULT_NUMBER_OF_PLAYERS + 1)) {
        ret.emplace_back(
            HumanPlayer {
                (boost::format("player%1%") % n).str(),
                (boost::format("Player %1%") % n).str(), true});
    }
    return ret;
}

}

struct Config::Impl {
    Impl();
    Impl(std::istream& in);

    void createPlayers(lua_State* lua);

    Engine::GameSettings settings {};
    std::vector<Player> players {getDefaultPlayers()};
    std::optional<Rng::result_type> seed {};
    std::optional<int> stanzas {};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    if (const auto max_players =
        getGlobal(lua.get(), MAX_PLAYERS_KEY, getInt)) {
        settings.maxPlayers = static_cast<int>(*max_players);
    }
    if (const auto min_players =
        getGlobal(lua.get(), MIN_PLAYERS_TO_START_KEY, getInt)) {
        settings.minPlayersToStart = static_cast<int>(*min_players);
    }
    settings.isPublic = getGlobal(lua.get(), IS_PUBLIC_KEY, getBool)
        .value_or(settings.isPublic);
    settings.allowSpectators =
        getGlobal(lua.get(), ALLOW_SPECTATORS_KEY, getBool)
        .value_or(settings.allowSpectators);
    if (const auto s = getGlobal(lua.get(), SEED_KEY, getInt)) {
        seed = static_cast<Rng::result_type>(*s);
    }
    if (const auto n = getGlobal(lua.get(), STANZAS_KEY, getInt)) {
        if (*n <= 0) {
            log(LogLevel::ERROR, "Expected positive number of stanzas: %d", *n);
            throw std::runtime_error {"Invalid number of stanzas in config"};
        }
        stanzas = static_cast<int>(*n);
    }
    createPlayers(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createPlayers(lua_State* lua)
{
    lua_getglobal(lua, PLAYERS_KEY.data());
    LuaPopGuard guard {lua};
    if (lua_isnoneornil(lua, -1)) {
        return;
    } else if (!lua_istable(lua, -1)) {
        failWrongType(PLAYERS_KEY, "table");
    }
    players.clear();
    for (auto i = 1;; ++i) {
        lua_rawgeti(lua, -1, i);
        LuaPopGuard guard2 {lua};
        if (lua_isnil(lua, -1)) {
            break;
        }
        players.emplace_back(getPlayer(lua, i));
    }
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

const Engine::GameSettings& Config::getGameSettings() const
{
    assert(impl);
    return impl->settings;
}

const std::vector<Player>& Config::getPlayers() const
{
    assert(impl);
    return impl->players;
}

std::optional<Rng::result_type> Config::getSeed() const
{
    assert(impl);
    return impl->seed;
}

std::optional<int> Config::getStanzas() const
{
    assert(impl);
    return impl->stanzas;
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
