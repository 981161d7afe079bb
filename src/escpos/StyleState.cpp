#include "escpos/StyleState.hpp"

#include <sstream>

namespace escpos {

    Font fontFromString(const std::string &name) {
        if (name == "B") return Font::B;
        if (name == "C") return Font::C;
        return Font::A;
    }

    Align alignFromString(const std::string &name) {
        if (name == "center") return Align::Center;
        if (name == "right") return Align::Right;
        return Align::Left;
    }

    Lang langFromString(const std::string &code) {
        static const std::unordered_map<std::string, Lang> langs = {
                {"en", Lang::En},
                {"fr", Lang::Fr},
                {"de", Lang::De},
                {"uk", Lang::Uk},
                {"da", Lang::Da},
                {"sv", Lang::Sv},
                {"it", Lang::It},
                {"es", Lang::Es},
                {"ja", Lang::Ja},
                {"no", Lang::No}
        };

        auto it = langs.find(code);
        return it != langs.end() ? it->second : Lang::En;
    }

    FeedOption feedOptionFromParams(const std::unordered_map<std::string, std::string> &params) {
        auto it = params.find("type");
        if (it != params.end() && it->second == "feed") {
            return FeedOption::Feed;
        }
        return FeedOption::NoFeed;
    }

    std::string styleStateToString(const StyleState &state) {
        std::ostringstream oss;
        oss << "font=" << static_cast<int>(state.fontWidth) << "x" << static_cast<int>(state.fontHeight)
            << " underline=" << static_cast<int>(state.underline)
            << " emphasize=" << static_cast<int>(state.emphasize)
            << " upsidedown=" << static_cast<int>(state.upsideDown)
            << " rotate=" << static_cast<int>(state.rotate)
            << " reverse=" << static_cast<int>(state.reverse)
            << " smooth=" << static_cast<int>(state.smooth);
        return oss.str();
    }

} // namespace escpos
