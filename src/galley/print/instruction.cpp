/**
 * @file instruction.cpp
 * @brief Debug renderings of abstract ticket instructions.
 */
#include "galley/print/instruction.hpp"

namespace galley::print {

const char* to_string(Op op) noexcept {
    switch (op) {
        case Op::Initialize: return "INIT";
        case Op::SetAlign:   return "ALIGN";
        case Op::SetSize:    return "SIZE";
        case Op::SetBold:    return "BOLD";
        case Op::SetInverse: return "INVERSE";
        case Op::Text:       return "TEXT";
        case Op::LineFeed:   return "LF";
        case Op::Feed:       return "FEED";
        case Op::Cut:        return "CUT";
        case Op::Buzzer:     return "BUZZER";
    }
    return "?";
}

std::string describe(const Ticket& t) {
    std::string out;
    for (const auto& ins : t) {
        out += to_string(ins.op);
        switch (ins.op) {
            case Op::Text:
                out += " \"";
                out += ins.text;
                out += '"';
                break;
            case Op::SetAlign:
            case Op::SetSize:
            case Op::SetBold:
            case Op::SetInverse:
            case Op::Feed:
                out += ' ';
                out += std::to_string(ins.arg);
                break;
            case Op::Buzzer:
                out += ' ';
                out += std::to_string(ins.arg);
                out += ' ';
                out += std::to_string(ins.arg2);
                break;
            default:
                break;
        }
        out += '\n';
    }
    return out;
}

std::string preview(const Ticket& t) {
    std::string out;
    bool inverse = false;
    for (const auto& ins : t) {
        switch (ins.op) {
            case Op::Text:
                if (inverse) out += '[';
                out += ins.text;
                if (inverse) out += ']';
                break;
            case Op::SetInverse:
                inverse = ins.arg != 0;
                break;
            case Op::LineFeed:
                out += '\n';
                break;
            case Op::Feed:
                out.append(ins.arg, '\n');
                break;
            case Op::Cut:
                out += "--------8<--------\n";
                break;
            default:
                break;
        }
    }
    return out;
}

} // namespace galley::print
