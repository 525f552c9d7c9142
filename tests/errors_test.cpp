// Copyright 2026 Rossi Sun
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <stepline/errors.h>

#include <arrow/testing/gtest_util.h>

#include <gtest/gtest.h>

namespace sl::test {

TEST(ErrorsTest, ErrorKinds) {
  EXPECT_EQ(GetErrorKind(Status::OK()), ErrorKind::NONE);
  EXPECT_EQ(GetErrorKind(Status::IOError("disk")), ErrorKind::OTHER);
  EXPECT_EQ(GetErrorKind(ConfigResolutionError(StatusCode::KeyError, "m", "a.b", "a")),
            ErrorKind::CONFIG_RESOLUTION);
  EXPECT_EQ(GetErrorKind(ValidationError("s", "bad")), ErrorKind::VALIDATION);
  EXPECT_EQ(GetErrorKind(ExecutionError("s", Status::IOError("disk"))), ErrorKind::EXECUTION);
  EXPECT_EQ(GetErrorKind(CancelledError("t", 2, {"a"})), ErrorKind::CANCELLED);
  EXPECT_FALSE(IsFrameworkError(Status::IOError("disk")));
  EXPECT_TRUE(IsFrameworkError(ValidationError("s", "bad")));
}

TEST(ErrorsTest, StatusCodes) {
  EXPECT_TRUE(ValidationError("s", "bad").IsInvalid());
  EXPECT_TRUE(ExecutionError("s", Status::IOError("disk")).IsExecutionError());
  EXPECT_TRUE(CancelledError("t", 1, {}).IsCancelled());
  EXPECT_TRUE(ConfigResolutionError(StatusCode::TypeError, "m", "p", "p").IsTypeError());
}

TEST(ErrorsTest, MessagesIdentifyTheUnit) {
  EXPECT_EQ(ValidationError("reader", "location must not be empty").message(),
            "Step 'reader': location must not be empty");
  EXPECT_EQ(ExecutionError("writer", Status::IOError("disk full")).message(),
            "Step 'writer' failed: disk full");
  EXPECT_EQ(CancelledError("etl", 3, {"a", "b"}).message(), "'etl' cancelled before child 3");
}

TEST(ErrorsTest, CompositionKeepsChildCode) {
  auto execution = ExecutionError("leaf", Status::IOError("disk"));
  auto composition = CompositionError("task", "leaf", 2, {"first"}, {}, execution);
  EXPECT_TRUE(composition.IsExecutionError());
  EXPECT_EQ(composition.message(), "Task 'task' failed at child 'leaf' (2): " +
                                       execution.message());

  auto detail = GetDetail<CompositionDetail>(composition);
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Task(), "task");
  EXPECT_EQ(detail->Child(), "leaf");
  EXPECT_EQ(detail->Position(), 2);
  EXPECT_EQ(detail->Completed(), (std::vector<std::string>{"first"}));
  EXPECT_TRUE(detail->Cause().Equals(execution));

  auto config = ConfigResolutionError(StatusCode::KeyError, "missing", "a", "<root>", "leaf");
  EXPECT_TRUE(CompositionError("task", "leaf", 1, {}, {}, config).IsKeyError());
}

TEST(ErrorsTest, GetDetailChecksType) {
  auto validation = ValidationError("s", "bad");
  EXPECT_EQ(GetDetail<ExecutionDetail>(validation), nullptr);
  ASSERT_NE(GetDetail<ValidationDetail>(validation), nullptr);
  EXPECT_EQ(GetDetail<ValidationDetail>(validation)->Step(), "s");
  EXPECT_EQ(GetDetail<ValidationDetail>(Status::OK()), nullptr);
}

TEST(ErrorsTest, UnwindNestedChain) {
  auto domain = Status::IOError("connection reset");
  auto leaf = ExecutionError("load", domain);
  auto inner = CompositionError("inner", "load", 2, {"extract"}, {}, leaf);
  auto outer = CompositionError("outer", "inner", 1, {}, {}, inner);

  ASSERT_TRUE(CauseOf(outer).Equals(inner));
  ASSERT_TRUE(CauseOf(domain).ok());
  ASSERT_TRUE(RootCause(outer).Equals(domain));
  ASSERT_TRUE(RootCause(domain).Equals(domain));

  auto frames = UnwindErrors(outer);
  ASSERT_EQ(frames.size(), 4);
  EXPECT_EQ(frames[0].kind, ErrorKind::COMPOSITION);
  EXPECT_EQ(frames[0].unit, "outer");
  EXPECT_EQ(frames[0].position, 1);
  EXPECT_EQ(frames[1].unit, "inner");
  EXPECT_EQ(frames[1].position, 2);
  EXPECT_EQ(frames[2].kind, ErrorKind::EXECUTION);
  EXPECT_EQ(frames[2].unit, "load");
  EXPECT_EQ(frames[3].kind, ErrorKind::OTHER);
  EXPECT_EQ(frames[3].message, "connection reset");

  ASSERT_EQ(FailingUnit(outer), "load");
  EXPECT_EQ(FailingUnit(domain), std::nullopt);
}

TEST(ErrorsTest, FormatErrorChain) {
  auto chain = CompositionError("etl", "load", 3, {"extract", "transform"}, {},
                                ExecutionError("load", Status::IOError("disk full")));
  EXPECT_EQ(FormatErrorChain(chain),
            chain.CodeAsString() +
            "\n"
            "  COMPOSITION [etl @3]: Task 'etl' failed at child 'load' (3): Step 'load' "
            "failed: disk full\n"
            "    EXECUTION [load]: Step 'load' failed: disk full\n"
            "      OTHER: disk full");
  EXPECT_EQ(FormatErrorChain(Status::OK()), "OK");
}

}  // namespace sl::test
