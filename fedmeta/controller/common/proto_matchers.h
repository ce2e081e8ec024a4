#ifndef FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_MATCHERS_H_
#define FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_MATCHERS_H_

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/util/field_comparator.h>
#include <google/protobuf/util/message_differencer.h>

namespace testing::proto {
using ::google::protobuf::util::DefaultFieldComparator;
using ::google::protobuf::util::MessageDifferencer;

MATCHER_P(EqualsProto, expected, "EqualsProto") {
  return MessageDifferencer::Equals(arg, expected);
}

// Floating point fields compare within fraction * |expected| + margin.
MATCHER_P3(ApproximatelyEqualsProto, expected, fraction, margin,
           "ApproximatelyEqualsProto") {
  DefaultFieldComparator comparator;
  comparator.set_float_comparison(DefaultFieldComparator::APPROXIMATE);
  comparator.SetDefaultFractionAndMargin(fraction, margin);

  MessageDifferencer differencer;
  differencer.set_field_comparator(&comparator);
  std::string report;
  differencer.ReportDifferencesToString(&report);
  if (!differencer.Compare(expected, arg)) {
    *result_listener << report;
    return false;
  }
  return true;
}

}  // namespace testing::proto

#endif  // FEDMETA_FEDMETA_CONTROLLER_COMMON_PROTO_MATCHERS_H_
