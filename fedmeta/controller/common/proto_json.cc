#include "fedmeta/controller/common/proto_json.h"

#include <google/protobuf/util/json_util.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace fedmeta {
namespace proto {

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;

absl::StatusOr<std::string> JsonOps::ToJsonLine(
    const google::protobuf::Message &message) {
  JsonPrintOptions options;
  options.add_whitespace = false;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = false;

  std::string line;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &line, options);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat("Cannot print ",
                                            message.GetTypeName(),
                                            " as JSON: ", status.ToString()));
  }
  return line;
}

absl::Status JsonOps::FromJsonLine(const std::string &line,
                                   google::protobuf::Message *message) {
  JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status =
      google::protobuf::util::JsonStringToMessage(line, message, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse ", message->GetTypeName(),
                     " from JSON: ", status.ToString()));
  }
  return absl::OkStatus();
}

std::vector<std::string> JsonOps::SplitLines(const std::string &blob) {
  std::vector<std::string> lines;
  for (absl::string_view line : absl::StrSplit(blob, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) lines.emplace_back(line);
  }
  return lines;
}

void JsonOps::SetRow(const Eigen::VectorXd &row,
                     google::protobuf::ListValue *list) {
  list->clear_values();
  for (Eigen::Index i = 0; i < row.size(); ++i) {
    list->add_values()->set_number_value(row(i));
  }
}

absl::StatusOr<Eigen::VectorXd> JsonOps::GetRow(
    const google::protobuf::ListValue &list) {
  Eigen::VectorXd row(list.values_size());
  for (int i = 0; i < list.values_size(); ++i) {
    const auto &value = list.values(i);
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
      return absl::InvalidArgumentError(
          absl::StrCat("Row entry ", i, " is not a number."));
    }
    row(i) = value.number_value();
  }
  return row;
}

}  // namespace proto
}  // namespace fedmeta
