#include "reco/Models.hpp"

namespace reco {

const char* action_str(Action a) {
    switch (a) {
        case Action::Watch: return "watch";
        case Action::Rate: return "rate";
        case Action::Skip: return "skip";
        case Action::Watchlist: return "watchlist";
        default: return "unknown";
    }
}

bool parse_action(const std::string& s, Action& out) {
    if (s == "watch") { out = Action::Watch; return true; }
    if (s == "rate") { out = Action::Rate; return true; }
    if (s == "skip") { out = Action::Skip; return true; }
    if (s == "watchlist") { out = Action::Watchlist; return true; }
    return false;
}

}  // namespace reco
