/**
 * @file escpos.cpp
 * @brief ESC/POS command tables for the thermal and impact dialects.
 */
#include "galley/print/escpos.hpp"

namespace galley::print {

using routing::PrinterDialect;

namespace {

constexpr std::uint8_t LF  = 0x0A;
constexpr std::uint8_t ESC = 0x1B;
constexpr std::uint8_t GS  = 0x1D;
constexpr std::uint8_t DLE = 0x10;
constexpr std::uint8_t EOT = 0x04;

// Thermal GS ! n: bits 0-2 height, bits 4-6 width.
constexpr std::uint8_t thermal_size(TextSize s) noexcept {
    switch (s) {
        case TextSize::Normal:       return 0x00;
        case TextSize::DoubleHeight: return 0x01;
        case TextSize::DoubleWidth:  return 0x10;
        case TextSize::Double:       return 0x11;
    }
    return 0x00;
}

// Impact ESC ! n: bit 4 double height, bit 5 double width.
constexpr std::uint8_t impact_size(TextSize s) noexcept {
    switch (s) {
        case TextSize::Normal:       return 0x00;
        case TextSize::DoubleHeight: return 0x10;
        case TextSize::DoubleWidth:  return 0x20;
        case TextSize::Double:       return 0x30;
    }
    return 0x00;
}

bool size_from_byte(std::uint8_t b, PrinterDialect d, TextSize& out) noexcept {
    for (auto s : {TextSize::Normal, TextSize::DoubleHeight, TextSize::DoubleWidth, TextSize::Double}) {
        const std::uint8_t v = (d == PrinterDialect::Thermal) ? thermal_size(s) : impact_size(s);
        if (v == b) { out = s; return true; }
    }
    return false;
}

} // namespace

const char* to_string(EncodeError::Code c) noexcept {
    switch (c) {
        case EncodeError::Code::UnsupportedCommand: return "unsupported_command";
        case EncodeError::Code::NonPrintableText:   return "non_printable_text";
        case EncodeError::Code::ArgumentOutOfRange: return "argument_out_of_range";
    }
    return "unknown";
}

const char* to_string(DecodeError::Code c) noexcept {
    switch (c) {
        case DecodeError::Code::Truncated:      return "truncated";
        case DecodeError::Code::UnknownCommand: return "unknown_command";
        case DecodeError::Code::BadArgument:    return "bad_argument";
    }
    return "unknown";
}

const char* EscPosEncoder::name() const noexcept {
    return dialect_ == PrinterDialect::Thermal ? "escpos-thermal" : "escpos-impact";
}

galley_detail::expected<Bytes, EncodeError> EscPosEncoder::encode(const Ticket& t) const {
    const bool thermal = dialect_ == PrinterDialect::Thermal;
    Bytes out;
    out.reserve(t.size() * 4);

    for (std::size_t i = 0; i < t.size(); ++i) {
        const Instruction& ins = t[i];
        const auto fail = [&](EncodeError::Code c) {
            return galley_detail::unexpected(EncodeError{c, i, ins.op});
        };

        switch (ins.op) {
            case Op::Initialize:
                out.insert(out.end(), {ESC, '@'});
                break;
            case Op::SetAlign:
                if (ins.arg > static_cast<std::uint8_t>(Align::Right)) return fail(EncodeError::Code::ArgumentOutOfRange);
                out.insert(out.end(), {ESC, 'a', ins.arg});
                break;
            case Op::SetSize: {
                if (ins.arg > static_cast<std::uint8_t>(TextSize::Double)) return fail(EncodeError::Code::ArgumentOutOfRange);
                const auto s = static_cast<TextSize>(ins.arg);
                if (thermal) out.insert(out.end(), {GS, '!', thermal_size(s)});
                else         out.insert(out.end(), {ESC, '!', impact_size(s)});
                break;
            }
            case Op::SetBold:
                out.insert(out.end(), {ESC, 'E', static_cast<std::uint8_t>(ins.arg ? 1 : 0)});
                break;
            case Op::SetInverse:
                // Impact printers print "inverse" spans in red (two-colour ribbon).
                if (thermal) out.insert(out.end(), {GS, 'B', static_cast<std::uint8_t>(ins.arg ? 1 : 0)});
                else         out.insert(out.end(), {ESC, 'r', static_cast<std::uint8_t>(ins.arg ? 1 : 0)});
                break;
            case Op::Text:
                for (char ch : ins.text) {
                    const auto c = static_cast<unsigned char>(ch);
                    if (c < 0x20 || c > 0x7E) return fail(EncodeError::Code::NonPrintableText);
                    out.push_back(c);
                }
                break;
            case Op::LineFeed:
                out.push_back(LF);
                break;
            case Op::Feed:
                out.insert(out.end(), {ESC, 'd', ins.arg});
                break;
            case Op::Cut:
                if (!thermal) return fail(EncodeError::Code::UnsupportedCommand);
                out.insert(out.end(), {GS, 'V', 'B', 0x00});
                break;
            case Op::Buzzer:
                out.insert(out.end(), {ESC, 'B', ins.arg, ins.arg2});
                break;
        }
    }
    return out;
}

galley_detail::expected<Ticket, DecodeError>
decode_escpos(std::span<const std::uint8_t> in, PrinterDialect dialect) {
    const bool thermal = dialect == PrinterDialect::Thermal;
    Ticket t;
    std::size_t i = 0;

    const auto fail = [&](DecodeError::Code c, std::size_t at) {
        return galley_detail::unexpected(DecodeError{c, at});
    };

    while (i < in.size()) {
        const std::uint8_t b = in[i];

        if (b >= 0x20 && b <= 0x7E) {
            std::string text;
            while (i < in.size() && in[i] >= 0x20 && in[i] <= 0x7E) {
                text.push_back(static_cast<char>(in[i]));
                ++i;
            }
            t.push_back(Instruction::print(std::move(text)));
            continue;
        }
        if (b == LF) {
            t.push_back(Instruction::line_feed());
            ++i;
            continue;
        }

        const std::size_t at = i;
        if (i + 1 >= in.size()) return fail(DecodeError::Code::Truncated, at);
        const std::uint8_t cmd = in[i + 1];

        if (b == ESC) {
            if (cmd == '@') {
                t.push_back(Instruction::initialize());
                i += 2;
                continue;
            }
            if (cmd == 'B') {
                if (i + 3 >= in.size()) return fail(DecodeError::Code::Truncated, at);
                t.push_back(Instruction::buzzer(in[i + 2], in[i + 3]));
                i += 4;
                continue;
            }
            if (i + 2 >= in.size()) return fail(DecodeError::Code::Truncated, at);
            const std::uint8_t n = in[i + 2];
            switch (cmd) {
                case 'a':
                    if (n > 2) return fail(DecodeError::Code::BadArgument, at);
                    t.push_back(Instruction::align(static_cast<Align>(n)));
                    break;
                case 'E':
                    t.push_back(Instruction::bold(n != 0));
                    break;
                case 'd':
                    t.push_back(Instruction::feed(n));
                    break;
                case '!': {
                    TextSize s{};
                    if (thermal || !size_from_byte(n, dialect, s)) return fail(DecodeError::Code::BadArgument, at);
                    t.push_back(Instruction::size(s));
                    break;
                }
                case 'r':
                    if (thermal) return fail(DecodeError::Code::UnknownCommand, at);
                    t.push_back(Instruction::inverse(n != 0));
                    break;
                default:
                    return fail(DecodeError::Code::UnknownCommand, at);
            }
            i += 3;
            continue;
        }

        if (b == GS && thermal) {
            if (cmd == 'V') {
                if (i + 3 >= in.size()) return fail(DecodeError::Code::Truncated, at);
                if (in[i + 2] != 'B') return fail(DecodeError::Code::BadArgument, at);
                t.push_back(Instruction::cut());
                i += 4;
                continue;
            }
            if (i + 2 >= in.size()) return fail(DecodeError::Code::Truncated, at);
            const std::uint8_t n = in[i + 2];
            if (cmd == '!') {
                TextSize s{};
                if (!size_from_byte(n, dialect, s)) return fail(DecodeError::Code::BadArgument, at);
                t.push_back(Instruction::size(s));
            } else if (cmd == 'B') {
                t.push_back(Instruction::inverse(n != 0));
            } else {
                return fail(DecodeError::Code::UnknownCommand, at);
            }
            i += 3;
            continue;
        }

        return fail(DecodeError::Code::UnknownCommand, at);
    }
    return t;
}

Bytes status_query() {
    return Bytes{DLE, EOT, 0x01};
}

bool status_online(std::uint8_t reply) noexcept {
    // Fixed bits: 0 and 7 clear, 1 and 4 set. Bit 3 set means offline.
    if ((reply & 0x93) != 0x12) return false;
    return (reply & 0x08) == 0;
}

} // namespace galley::print
