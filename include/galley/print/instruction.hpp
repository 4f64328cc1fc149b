#pragma once
/**
 * @file instruction.hpp
 * @brief Transport-agnostic printer instructions (style + text stream).
 * @details The ticket builder emits a Ticket; an encoder maps it onto a concrete
 *          byte protocol. Keeping this layer abstract lets one ticket layout
 *          drive several printer protocols.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace galley::print {

/** @enum Align
 *  @brief Horizontal justification of following lines.
 */
enum class Align : std::uint8_t { Left = 0, Center = 1, Right = 2 };

/** @enum TextSize
 *  @brief Character magnification of following text.
 */
enum class TextSize : std::uint8_t {
    Normal       = 0,
    DoubleHeight = 1,
    DoubleWidth  = 2,
    Double       = 3  ///< Double width and height
};

/** @enum Op
 *  @brief Instruction opcode.
 */
enum class Op : std::uint8_t {
    Initialize,  ///< Reset printer state
    SetAlign,    ///< arg = Align
    SetSize,     ///< arg = TextSize
    SetBold,     ///< arg = 0/1
    SetInverse,  ///< arg = 0/1 (white on black, or red ribbon on impact printers)
    Text,        ///< text = printable ASCII, no line terminator
    LineFeed,    ///< Print buffer and advance one line
    Feed,        ///< arg = number of lines to feed
    Cut,         ///< Partial cut
    Buzzer       ///< arg = times, arg2 = duration unit
};

const char* to_string(Op op) noexcept;

/** @struct Instruction
 *  @brief One abstract printer instruction.
 */
struct Instruction {
    Op           op{Op::Initialize};
    std::uint8_t arg{0};    ///< Primary operand (see Op)
    std::uint8_t arg2{0};   ///< Secondary operand (Buzzer duration)
    std::string  text;      ///< Payload for Op::Text

    bool operator==(const Instruction&) const = default;

    static Instruction initialize() { return {Op::Initialize, 0, 0, {}}; }
    static Instruction align(Align a) { return {Op::SetAlign, static_cast<std::uint8_t>(a), 0, {}}; }
    static Instruction size(TextSize s) { return {Op::SetSize, static_cast<std::uint8_t>(s), 0, {}}; }
    static Instruction bold(bool on) { return {Op::SetBold, static_cast<std::uint8_t>(on ? 1 : 0), 0, {}}; }
    static Instruction inverse(bool on) { return {Op::SetInverse, static_cast<std::uint8_t>(on ? 1 : 0), 0, {}}; }
    static Instruction print(std::string s) { return {Op::Text, 0, 0, std::move(s)}; }
    static Instruction line_feed() { return {Op::LineFeed, 0, 0, {}}; }
    static Instruction feed(std::uint8_t lines) { return {Op::Feed, lines, 0, {}}; }
    static Instruction cut() { return {Op::Cut, 0, 0, {}}; }
    static Instruction buzzer(std::uint8_t times, std::uint8_t duration) { return {Op::Buzzer, times, duration, {}}; }
};

/// Ordered instruction stream for one ticket.
using Ticket = std::vector<Instruction>;

/// Human-readable dump, one instruction per line ("TEXT \"2x BURGER\"").
std::string describe(const Ticket& t);

/// Plain-text preview: text and line feeds only, inverse spans wrapped in [ ].
std::string preview(const Ticket& t);

} // namespace galley::print
