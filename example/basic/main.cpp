// main.cpp
// Settings Editor Example - ImmutableObject state driven by a lager store
//
// Every action derives a new sealed settings object from the current one:
//   - Rename: set_property on the root
//   - Volume: path_lens into a nested object
//   - Patch: set_deep with a nested patch
//   - Reset: set replaces a whole section
//   - Forget: delete_property
// Old versions are kept in a history, so undo/redo is just swapping values.

#include <imval/builders.h>
#include <imval/immutable_object.h>
#include <imval/lenses.h>
#include <imval/value.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <immer/vector.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace imval;

// ============================================================
// Application State and Actions
// ============================================================

struct Rename
{
    std::string name;
};

struct ChangeVolume
{
    int delta;
};

struct ApplyPatch
{
    Value patch;
};

struct ResetDisplay {};

struct Forget
{
    std::string key;
};

struct Undo {};
struct Redo {};

using Action = std::variant<Rename, ChangeVolume, ApplyPatch, ResetDisplay, Forget, Undo, Redo>;

struct AppState
{
    ImmutableObject settings;
    immer::vector<ImmutableObject> history;
    immer::vector<ImmutableObject> future;
};

AppState create_initial_state()
{
    auto display = ObjectBuilder()
        .set("width", 1920)
        .set("height", 1080)
        .set("fullscreen", false)
        .finish();

    auto settings = create({Value::map({
        {"name", "untitled"},
        {"display", display},
        {"audio", Value::object({{"volume", 80}, {"muted", false}})},
        {"recent", Value::vector({"a.txt", "b.txt"})},
    })});

    return AppState{
        .settings = std::move(settings),
        .history  = {},
        .future   = {}
    };
}

// ============================================================
// Reducer
// ============================================================

AppState commit(const AppState& state, ImmutableObject next)
{
    auto new_state     = state;
    new_state.history  = state.history.push_back(state.settings);
    new_state.future   = {};
    new_state.settings = std::move(next);
    return new_state;
}

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;

                auto new_state     = state;
                new_state.future   = state.future.push_back(state.settings);
                new_state.settings = state.history.back();
                new_state.history  = state.history.take(state.history.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;

                auto new_state     = state;
                new_state.history  = state.history.push_back(state.settings);
                new_state.settings = state.future.back();
                new_state.future   = state.future.take(state.future.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, Rename>) {
                return commit(state, set_property(state.settings, "name", act.name));

            } else if constexpr (std::is_same_v<T, ChangeVolume>) {
                auto lens    = path_lens({"audio", "volume"});
                auto updated = lager::over(lens, Value{state.settings},
                                           [&](Value v) { return Value{v.as_int() + act.delta}; });
                return commit(state, updated.as<ImmutableObject>());

            } else if constexpr (std::is_same_v<T, ApplyPatch>) {
                return commit(state, set_deep(state.settings, act.patch));

            } else if constexpr (std::is_same_v<T, ResetDisplay>) {
                auto defaults = Value::map({{"display", Value::object({{"width", 1280}, {"height", 720}})}});
                return commit(state, set(state.settings, defaults));

            } else if constexpr (std::is_same_v<T, Forget>) {
                return commit(state, delete_property(state.settings, act.key));
            }

            return state;
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== Settings Editor Example ===\n\n";

    while (true) {
        std::cout << "Current settings:\n";
        print_value(Value{store.get().settings}, "", 1);

        std::cout << "\n=== Operations ===\n";
        std::cout << "N. Rename\n";
        std::cout << "+. Volume up\n";
        std::cout << "-. Volume down\n";
        std::cout << "F. Toggle fullscreen (deep patch)\n";
        std::cout << "D. Reset display (shallow set)\n";
        std::cout << "X. Forget a key\n";
        std::cout << "U. Undo\n";
        std::cout << "R. Redo\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice))
            break;
        std::cin.ignore();

        try {
            switch (choice) {
            case 'N':
            case 'n': {
                std::cout << "Enter new name: ";
                std::string name;
                std::getline(std::cin, name);
                store.dispatch(Rename{name});
                break;
            }
            case '+':
                store.dispatch(ChangeVolume{10});
                break;
            case '-':
                store.dispatch(ChangeVolume{-10});
                break;
            case 'F':
            case 'f': {
                bool fullscreen = store.get().settings.at("display").at("fullscreen").as_bool();
                store.dispatch(ApplyPatch{Value::map({{"display", Value::map({{"fullscreen", !fullscreen}})}})});
                break;
            }
            case 'D':
            case 'd':
                store.dispatch(ResetDisplay{});
                break;
            case 'X':
            case 'x': {
                std::cout << "Enter key: ";
                std::string key;
                std::getline(std::cin, key);
                store.dispatch(Forget{key});
                break;
            }
            case 'U':
            case 'u':
                store.dispatch(Undo{});
                break;
            case 'R':
            case 'r':
                store.dispatch(Redo{});
                break;
            case 'Q':
            case 'q':
                return 0;
            default:
                std::cout << "Unknown choice\n";
            }
        } catch (const ImmutableValueError& e) {
            std::cout << "Error: " << e.what() << "\n";
        }

        std::cout << "\n";
    }

    return 0;
}
