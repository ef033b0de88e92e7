// main.cpp - Lens Transform Example
//
// A small lager store whose reducer (packet_store.h) is written entirely
// with optics lenses and transforms.

#include "packet_store.h"

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <cstdint>
#include <iostream>
#include <string>

using namespace packet_store;

// ============================================================
// Printing
// ============================================================

void print_state(const AppState& state)
{
    const auto& header = state.packet.header;
    std::cout << "  version:    " << header.version << "\n";
    std::cout << "  count:      " << header.count << "\n";
    std::cout << "  compressed: " << (header.compressed ? "yes" : "no") << "\n";
    std::cout << "  payload:    \"" << state.packet.payload << "\"\n";
    std::cout << "  samples:   ";
    for (auto s : state.samples) {
        std::cout << " " << s;
    }
    std::cout << "\n  history:    " << state.history.size() << " entries\n";
}

void print_paths()
{
    std::cout << "count      -> " << count_lens.path() << "\n";
    std::cout << "compressed -> " << compressed_lens.path() << "\n";
    std::cout << "payload    -> " << payload_lens.path() << "\n";
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== Lens Transform Example ===\n";
    print_paths();

    while (true) {
        std::cout << "\nCurrent state:\n";
        print_state(store.get());

        std::cout << "\n=== Operations ===\n";
        std::cout << "+. Increment count\n";
        std::cout << "-. Decrement count\n";
        std::cout << "*. Scale count\n";
        std::cout << "T. Toggle compression\n";
        std::cout << "P. Set payload\n";
        std::cout << "S. Set sample\n";
        std::cout << "U. Undo (packet and samples)\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice))
            break;
        std::cin.ignore();

        switch (choice) {
        case '+':
            store.dispatch(Increment{});
            break;
        case '-':
            store.dispatch(Decrement{});
            break;
        case '*': {
            std::cout << "Enter factor: ";
            uint32_t factor;
            std::cin >> factor;
            std::cin.ignore();
            store.dispatch(Scale{factor});
            break;
        }
        case 'T':
        case 't':
            store.dispatch(ToggleCompression{});
            break;
        case 'P':
        case 'p': {
            std::cout << "Enter payload: ";
            std::string text;
            std::getline(std::cin, text);
            store.dispatch(SetPayload{text});
            break;
        }
        case 'S':
        case 's': {
            std::cout << "Enter sample index: ";
            std::size_t index;
            std::cin >> index;
            std::cout << "Enter value: ";
            uint32_t value;
            std::cin >> value;
            std::cin.ignore();
            store.dispatch(SetSample{index, value});
            break;
        }
        case 'U':
        case 'u':
            store.dispatch(Undo{});
            break;
        case 'Q':
        case 'q':
            return 0;
        default:
            std::cerr << "[Demo] Unknown choice: " << choice << "\n";
            break;
        }
    }

    return 0;
}
