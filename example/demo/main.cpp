// main.cpp - Tick loop example
//
// A small game room whose live state is mutated by actions every tick.
// After each tick the observer reports the patches a server would send.

#include <state_observer/json_pointer.h>
#include <state_observer/live_value.h>
#include <state_observer/state_observer.h>

#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace state_observer;

// ============================================================
// Room State
// ============================================================

class Room;

/// Player with a back-reference to its room; only the hook's fields are sent
class Player : public Observable
{
public:
    Player(std::string name, std::weak_ptr<Room> room)
        : name_(std::move(name)), room_(std::move(room)) {}

    std::optional<LiveValue> to_json() const override
    {
        return LiveValue::record({{"name", name_}, {"hp", hp}, {"x", x}, {"y", y}});
    }

    int64_t hp = 100;
    double x = 0.0;
    double y = 0.0;

private:
    std::string name_;
    std::weak_ptr<Room> room_;
};

class Room : public Observable, public std::enable_shared_from_this<Room>
{
public:
    std::optional<LiveValue> to_json() const override
    {
        return LiveValue::record({{"round", round}, {"players", players}, {"log", log}});
    }

    Player& player(std::size_t index) const
    {
        return static_cast<Player&>(*players->at(index).as<ObservablePtr>());
    }

    int64_t round = 1;
    LiveArrayPtr players = LiveArray::make();
    LiveArrayPtr log = LiveArray::make();
};

// ============================================================
// Actions
// ============================================================

struct Join { std::string name; };
struct Move { std::size_t player; double dx; double dy; };
struct Hit  { std::size_t player; int64_t damage; };
struct Leave {};
struct NextRound {};

using Action = std::variant<Join, Move, Hit, Leave, NextRound>;

void apply(Room& room, const Action& action)
{
    std::visit(
        [&](const auto& act) {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Join>) {
                room.players->push_back(std::make_shared<Player>(act.name, room.weak_from_this()));
                room.log->push_back(act.name + " joined");
            } else if constexpr (std::is_same_v<T, Move>) {
                auto& p = room.player(act.player);
                p.x += act.dx;
                p.y += act.dy;
            } else if constexpr (std::is_same_v<T, Hit>) {
                room.player(act.player).hp -= act.damage;
            } else if constexpr (std::is_same_v<T, Leave>) {
                room.players->pop_back();
                room.log->push_back("a player left");
            } else {
                ++room.round;
                room.log->clear();
            }
        },
        action);
}

// ============================================================
// Main
// ============================================================

int main()
{
    auto room = std::make_shared<Room>();
    apply(*room, Join{"alice"});

    StateObserver observer{LiveValue{room}};
    std::cout << "Initial snapshot:\n";
    print_value(observer.snapshot(), "", 1);

    const std::vector<std::vector<Action>> ticks = {
        {Join{"bob"}},
        {Move{0, 1.5, 0.0}, Move{1, 0.0, -2.0}},
        {},
        {Hit{1, 30}},
        {Leave{}},
        {NextRound{}},
    };

    for (std::size_t tick = 0; tick < ticks.size(); ++tick) {
        for (const auto& action : ticks[tick]) {
            apply(*room, action);
        }

        auto patches = observer.get_patches();
        std::cout << "\nTick " << tick + 1 << " (" << patches.size() << " patches)\n";
        print_patches(patches);
        std::cout << "  wire: " << patches_to_json(patches) << "\n";
    }

    std::cout << "\nRound in snapshot: "
              << value_to_json(get_by_pointer(observer.snapshot(), "/round")) << "\n";
    std::cout << "First player: "
              << value_to_json(get_by_pointer(observer.snapshot(), "/players/0")) << "\n";

    return 0;
}
