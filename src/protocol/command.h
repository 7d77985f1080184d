#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace protocol {

// Live text preview; the receiver only displays it.
struct Preview {
  std::string text;
  bool operator==(const Preview&) const = default;
};

struct Insert {
  std::string text;
  bool operator==(const Insert&) const = default;
};

struct InsertAndSubmit {
  std::string text;
  bool operator==(const InsertAndSubmit&) const = default;
};

struct Submit {
  bool operator==(const Submit&) const = default;
};

struct ClearField {
  bool operator==(const ClearField&) const = default;
};

struct Paste {
  bool operator==(const Paste&) const = default;
};

struct DeleteChar {
  bool operator==(const DeleteChar&) const = default;
};

struct SelectAll {
  bool operator==(const SelectAll&) const = default;
};

struct Copy {
  bool operator==(const Copy&) const = default;
};

struct Cut {
  bool operator==(const Cut&) const = default;
};

// Sender -> receiver: click the saved position before editing commands.
struct SetPrePositionClick {
  bool enabled = false;
  bool operator==(const SetPrePositionClick&) const = default;
};

// Receiver -> sender: echo of the current pre-position click setting.
struct PrePositionClickState {
  bool enabled = false;
  bool operator==(const PrePositionClickState&) const = default;
};

struct BatchAnnounce {
  std::vector<std::string> fileNames;
  bool operator==(const BatchAnnounce&) const = default;
};

// index is 1-based, 1 <= index <= total.
struct BatchItemStarting {
  std::string fileName;
  int index = 0;
  int total = 0;
  bool operator==(const BatchItemStarting&) const = default;
};

struct BatchComplete {
  bool operator==(const BatchComplete&) const = default;
};

using Command = std::variant<Preview,
                             Insert,
                             InsertAndSubmit,
                             Submit,
                             ClearField,
                             Paste,
                             DeleteChar,
                             SelectAll,
                             Copy,
                             Cut,
                             SetPrePositionClick,
                             PrePositionClickState,
                             BatchAnnounce,
                             BatchItemStarting,
                             BatchComplete>;

// Wire discriminant of a command ("insert", "batch_item_starting", ...).
std::string_view commandName(const Command& cmd);

// Serialized form of exactly one command. nullopt only when the command cannot be
// represented (text that is not valid UTF-8, or larger than a single frame).
std::optional<std::vector<uint8_t>> encodeCommand(const Command& cmd);

// Reconstructs a command without side effects. Malformed bytes, an unknown type or a
// mistyped field yield nullopt; `err` receives a short reason when non-null.
std::optional<Command> decodeCommand(std::span<const uint8_t> bytes, std::string* err = nullptr);

} // namespace protocol
