#include "src/protocol/command.h"

#include "common/framing.hpp"
#include "common/json.hpp"

#include <type_traits>

namespace protocol {

using common::json;

namespace {

constexpr int kWireVersion = 1;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool fail(std::string* err, std::string_view why) {
  if (err) *err = std::string(why);
  return false;
}

bool readString(const json& j, const char* key, std::string* out, std::string* err) {
  if (!j.contains(key) || !j[key].is_string()) return fail(err, std::string("missing string field '") + key + "'");
  *out = j[key].get<std::string>();
  return true;
}

bool readBool(const json& j, const char* key, bool* out, std::string* err) {
  if (!j.contains(key) || !j[key].is_boolean()) return fail(err, std::string("missing bool field '") + key + "'");
  *out = j[key].get<bool>();
  return true;
}

bool readInt(const json& j, const char* key, int* out, std::string* err) {
  if (!j.contains(key) || !j[key].is_number_integer()) {
    return fail(err, std::string("missing integer field '") + key + "'");
  }
  const auto v = j[key].get<int64_t>();
  if (v < 0 || v > 1'000'000) return fail(err, std::string("field '") + key + "' out of range");
  *out = static_cast<int>(v);
  return true;
}

} // namespace

std::string_view commandName(const Command& cmd) {
  return std::visit(Overloaded{
                        [](const Preview&) { return std::string_view("preview"); },
                        [](const Insert&) { return std::string_view("insert"); },
                        [](const InsertAndSubmit&) { return std::string_view("insert_and_submit"); },
                        [](const Submit&) { return std::string_view("submit"); },
                        [](const ClearField&) { return std::string_view("clear_field"); },
                        [](const Paste&) { return std::string_view("paste"); },
                        [](const DeleteChar&) { return std::string_view("delete_char"); },
                        [](const SelectAll&) { return std::string_view("select_all"); },
                        [](const Copy&) { return std::string_view("copy"); },
                        [](const Cut&) { return std::string_view("cut"); },
                        [](const SetPrePositionClick&) { return std::string_view("set_pre_position_click"); },
                        [](const PrePositionClickState&) { return std::string_view("pre_position_click_state"); },
                        [](const BatchAnnounce&) { return std::string_view("batch_announce"); },
                        [](const BatchItemStarting&) { return std::string_view("batch_item_starting"); },
                        [](const BatchComplete&) { return std::string_view("batch_complete"); },
                    },
                    cmd);
}

std::optional<std::vector<uint8_t>> encodeCommand(const Command& cmd) {
  json j;
  j["v"] = kWireVersion;
  j["type"] = std::string(commandName(cmd));
  std::visit(Overloaded{
                 [&](const Preview& c) { j["text"] = c.text; },
                 [&](const Insert& c) { j["text"] = c.text; },
                 [&](const InsertAndSubmit& c) { j["text"] = c.text; },
                 [&](const SetPrePositionClick& c) { j["enabled"] = c.enabled; },
                 [&](const PrePositionClickState& c) { j["enabled"] = c.enabled; },
                 [&](const BatchAnnounce& c) { j["file_names"] = c.fileNames; },
                 [&](const BatchItemStarting& c) {
                   j["file_name"] = c.fileName;
                   j["index"] = c.index;
                   j["total"] = c.total;
                 },
                 [](const auto&) {},
             },
             cmd);

  const auto dumped = common::dump_json(j);
  if (!dumped || dumped->size() > common::kMaxFrameSize) return std::nullopt;
  return std::vector<uint8_t>(dumped->begin(), dumped->end());
}

std::optional<Command> decodeCommand(std::span<const uint8_t> bytes, std::string* err) {
  if (bytes.empty()) {
    fail(err, "empty payload");
    return std::nullopt;
  }
  const auto parsed = common::parse_json_bytes(bytes);
  if (!parsed) {
    fail(err, "malformed json");
    return std::nullopt;
  }
  const json& j = *parsed;
  if (!j.is_object()) {
    fail(err, "payload is not an object");
    return std::nullopt;
  }
  if (!j.contains("type") || !j["type"].is_string()) {
    fail(err, "missing type");
    return std::nullopt;
  }
  const std::string type = j["type"].get<std::string>();

  std::string text;
  bool enabled = false;

  if (type == "preview") {
    if (!readString(j, "text", &text, err)) return std::nullopt;
    return Preview{std::move(text)};
  }
  if (type == "insert") {
    if (!readString(j, "text", &text, err)) return std::nullopt;
    return Insert{std::move(text)};
  }
  if (type == "insert_and_submit") {
    if (!readString(j, "text", &text, err)) return std::nullopt;
    return InsertAndSubmit{std::move(text)};
  }
  if (type == "submit") return Submit{};
  if (type == "clear_field") return ClearField{};
  if (type == "paste") return Paste{};
  if (type == "delete_char") return DeleteChar{};
  if (type == "select_all") return SelectAll{};
  if (type == "copy") return Copy{};
  if (type == "cut") return Cut{};
  if (type == "set_pre_position_click") {
    if (!readBool(j, "enabled", &enabled, err)) return std::nullopt;
    return SetPrePositionClick{enabled};
  }
  if (type == "pre_position_click_state") {
    if (!readBool(j, "enabled", &enabled, err)) return std::nullopt;
    return PrePositionClickState{enabled};
  }
  if (type == "batch_announce") {
    if (!j.contains("file_names") || !j["file_names"].is_array()) {
      fail(err, "missing array field 'file_names'");
      return std::nullopt;
    }
    BatchAnnounce out;
    for (const auto& v : j["file_names"]) {
      if (!v.is_string()) {
        fail(err, "file_names entry is not a string");
        return std::nullopt;
      }
      out.fileNames.push_back(v.get<std::string>());
    }
    return out;
  }
  if (type == "batch_item_starting") {
    BatchItemStarting out;
    if (!readString(j, "file_name", &out.fileName, err)) return std::nullopt;
    if (!readInt(j, "index", &out.index, err)) return std::nullopt;
    if (!readInt(j, "total", &out.total, err)) return std::nullopt;
    if (out.index < 1 || out.index > out.total) {
      fail(err, "batch index out of range");
      return std::nullopt;
    }
    return out;
  }
  if (type == "batch_complete") return BatchComplete{};

  fail(err, "unknown command '" + type + "'");
  return std::nullopt;
}

} // namespace protocol
