#ifndef FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_JSON_H_
#define FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_JSON_H_

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/text_format.h>

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "absl/status/statusor.h"
#include "fedmeta/controller/common/macros.h"

namespace fedmeta {
namespace proto {

// Artifacts are blobs of UTF-8, line-delimited JSON objects; every helper
// here speaks that format.
class JsonOps {
 public:
  // Prints a message as a single JSON line (no trailing newline). Zero
  // valued fields are printed so every payload carries its full shape.
  static absl::StatusOr<std::string> ToJsonLine(
      const google::protobuf::Message &message);

  static absl::Status FromJsonLine(const std::string &line,
                                   google::protobuf::Message *message);

  // Splits a blob into its non-blank lines.
  static std::vector<std::string> SplitLines(const std::string &blob);

  // Parses every line of every blob into a T.
  template <typename T>
  static absl::StatusOr<std::vector<T>> ParseBlobs(
      const std::vector<std::string> &blobs) {
    std::vector<T> parsed;
    for (const auto &blob : blobs) {
      for (const auto &line : SplitLines(blob)) {
        T message;
        RETURN_IF_ERROR(FromJsonLine(line, &message));
        parsed.push_back(std::move(message));
      }
    }
    return parsed;
  }

  static void SetRow(const Eigen::VectorXd &row,
                     google::protobuf::ListValue *list);

  // Fails if any entry of the list is not a number.
  static absl::StatusOr<Eigen::VectorXd> GetRow(
      const google::protobuf::ListValue &list);

  template <typename T>
  static T ParseTextOrDie(const std::string &input) {
    T result;
    VALIDATE(google::protobuf::TextFormat::ParseFromString(input, &result));
    return result;
  }
};

}  // namespace proto
}  // namespace fedmeta

#endif  // FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_JSON_H_
