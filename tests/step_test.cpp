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
#include <stepline/step.h>

#include <arrow/testing/gtest_util.h>
#include <arrow/util/cancel.h>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "test_steps.h"

namespace sl::test {

namespace {

Script ConnectionScript() {
  Script script;
  script.config = {{"db.host", ValueKind::STRING},
                   {"db.port", ValueKind::INT64},
                   {"db.timeout", ValueKind::DOUBLE}};
  script.emit.Set("connected", true);
  script.output = {{"connected", ValueKind::BOOL}};
  return script;
}

Context ConnectionContext() {
  return Context(Mapping{{"db", Value(Mapping{{"host", Value("localhost")},
                                              {"port", Value(5432)},
                                              {"timeout", Value(3)}})}});
}

class BoundedBatchStep : public Step {
 public:
  BoundedBatchStep() : Step("batch") {}

 protected:
  Requirements Declare() const override {
    Requirements requirements;
    requirements.config.push_back({"batch.size", ValueKind::INT64});
    return requirements;
  }

  Status CheckConfig(const Context& ctx) const override {
    ARROW_ASSIGN_OR_RAISE(auto size, ctx.ResolveInt64("batch.size"));
    if (size <= 0) {
      return ValidationFailure("batch.size must be positive");
    }
    if (size > 1000) {
      return Status::Invalid("batch.size must not exceed 1000");
    }
    return Status::OK();
  }

  Result<Output> DoExecute(const Context&, const Output&, const ExecContext&) override {
    return Output();
  }
};

}  // namespace

TEST(StepTest, ValidateSucceedsWithAllRequiredPaths) {
  auto step = MakeStep("connect", ConnectionScript());
  EXPECT_EQ(step->State(), StepState::CONSTRUCTED);
  ASSERT_OK(step->Validate(ConnectionContext()));
  EXPECT_EQ(step->State(), StepState::VALIDATED);
  EXPECT_EQ(step->NumExecutions(), 0);
}

TEST(StepTest, RemovingAnyRequiredKeyFailsValidation) {
  for (const auto& removed : {"host", "port", "timeout"}) {
    Mapping db = ConnectionContext().Scoped("db").ValueOrDie().Root();
    db.erase(removed);
    Context ctx(Mapping{{"db", Value(db)}});

    auto step = MakeStep("connect", ConnectionScript());
    auto st = step->Validate(ctx);
    ASSERT_RAISES(KeyError, st);
    EXPECT_EQ(GetErrorKind(st), ErrorKind::CONFIG_RESOLUTION);
    auto detail = GetDetail<ConfigResolutionDetail>(st);
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->Path(), std::string("db.") + removed);
    EXPECT_EQ(detail->StoppedAt(), "db");
    EXPECT_EQ(detail->Step(), "connect");
    EXPECT_EQ(step->State(), StepState::FAILED);
  }
}

TEST(StepTest, WrongKindFailsValidation) {
  ASSERT_OK_AND_ASSIGN(auto ctx, ConnectionContext().With("db.port", "5432"));
  auto step = MakeStep("connect", ConnectionScript());
  auto st = step->Validate(ctx);
  ASSERT_RAISES(TypeError, st);
  EXPECT_EQ(GetErrorKind(st), ErrorKind::CONFIG_RESOLUTION);
  EXPECT_EQ(GetDetail<ConfigResolutionDetail>(st)->Step(), "connect");
}

TEST(StepTest, CheckConfigFailuresAreValidationErrors) {
  BoundedBatchStep step;
  ASSERT_OK(step.Validate(Context(Mapping{{"batch", Value(Mapping{{"size", Value(10)}})}})));

  auto st = step.Validate(Context(Mapping{{"batch", Value(Mapping{{"size", Value(0)}})}}));
  ASSERT_RAISES(Invalid, st);
  EXPECT_EQ(GetErrorKind(st), ErrorKind::VALIDATION);
  EXPECT_EQ(st.message(), "Step 'batch': batch.size must be positive");

  // Untyped failures from the hook are attributed to the step too.
  st = step.Validate(Context(Mapping{{"batch", Value(Mapping{{"size", Value(5000)}})}}));
  ASSERT_RAISES(Invalid, st);
  EXPECT_EQ(GetDetail<ValidationDetail>(st)->Step(), "batch");
}

TEST(StepTest, ExecuteValidatesFirst) {
  auto step = MakeStep("connect", ConnectionScript());
  auto result = step->Execute(Context());
  ASSERT_RAISES(KeyError, result);
  EXPECT_EQ(step->NumExecutions(), 0);

  ASSERT_OK_AND_ASSIGN(auto output, step->Execute(ConnectionContext()));
  EXPECT_EQ(step->NumExecutions(), 1);
  EXPECT_EQ(step->State(), StepState::SUCCEEDED);
  EXPECT_EQ(*output.Get("connected"), Value(true));
}

TEST(StepTest, ExecuteChecksDeclaredInput) {
  Script script;
  script.input = {{"rows", ValueKind::INT64}};
  auto step = MakeStep("consume", script);

  auto result = step->Execute(Context(), Output());
  ASSERT_RAISES(Invalid, result);
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::VALIDATION);
  EXPECT_EQ(step->NumExecutions(), 0);

  Output input;
  input.Set("rows", 10);
  ASSERT_OK(step->Execute(Context(), input).status());
  EXPECT_EQ(*step->LastInput().Get("rows"), Value(10));
}

TEST(StepTest, DomainFailureBecomesExecutionError) {
  auto step = MakeFailingStep("load", Status::IOError("disk full"));
  auto result = step->Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_EQ(step->State(), StepState::FAILED);

  auto detail = GetDetail<ExecutionDetail>(result.status());
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Step(), "load");
  EXPECT_TRUE(detail->Cause().IsIOError());
  EXPECT_EQ(result.status().message(), "Step 'load' failed: disk full");
}

TEST(StepTest, ThrownExceptionBecomesExecutionError) {
  Script script;
  script.throws = true;
  auto step = MakeStep("explode", script);
  auto result = step->Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  auto cause = CauseOf(result.status());
  EXPECT_TRUE(cause.IsUnknownError());
  EXPECT_NE(cause.message().find("scripted exception in explode"), std::string::npos);
}

TEST(StepTest, OutputSchemaViolationBecomesExecutionError) {
  Script script;
  script.output = {{"rows", ValueKind::INT64}};
  script.emit.Set("rows", "many");
  auto step = MakeStep("count", script);
  auto result = step->Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_TRUE(CauseOf(result.status()).IsTypeError());
}

TEST(StepTest, RoleRequirements) {
  auto reader = std::make_shared<ScriptedStep>("reader", Script{}, nullptr, StepRole::READER);
  ASSERT_EQ(reader->GetRequirements().output.size(), 1);
  EXPECT_EQ(reader->GetRequirements().output[0].name, kTableField);
  // A reader that produces no table violates its schema.
  ASSERT_RAISES(ExecutionError, reader->Execute(Context()));

  auto transform =
      std::make_shared<ScriptedStep>("transform", Script{}, nullptr, StepRole::TRANSFORMATION);
  EXPECT_EQ(transform->GetRequirements().input.size(), 1);
  auto result = transform->Execute(Context());
  ASSERT_RAISES(Invalid, result);
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::VALIDATION);

  Script writes;
  writes.emit.Set("rows_written", 3);
  auto writer = std::make_shared<ScriptedStep>("writer", writes, nullptr, StepRole::WRITER);
  Output input;
  input.Set(kTableField, MakePeopleTable());
  ASSERT_OK(writer->Execute(Context(), input).status());
  EXPECT_EQ(StepRoleToString(writer->Role()), "WRITER");
}

TEST(StepTest, CancelledBeforeStart) {
  ::arrow::StopSource source;
  source.RequestStop();
  auto step = MakeStep("never");
  auto result = step->Execute(Context(), Output(), ExecContext{source.token()});
  ASSERT_RAISES(Cancelled, result);
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::CANCELLED);
  EXPECT_EQ(step->NumExecutions(), 0);
}

TEST(StepTest, CancelledStatusFromHookIsTyped) {
  auto step = MakeFailingStep("interrupted", Status::Cancelled("interrupted"));
  auto result = step->Execute(Context());
  ASSERT_RAISES(Cancelled, result);
  auto detail = GetDetail<CancelledDetail>(result.status());
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Unit(), "interrupted");
}

TEST(StepTest, RunUsesBoundContext) {
  auto bound = std::make_shared<const Context>(ConnectionContext());
  ScriptedStep step("connect", ConnectionScript(), nullptr, StepRole::GENERIC, bound);
  EXPECT_EQ(&step.BoundContext(), bound.get());
  ASSERT_OK_AND_ASSIGN(auto output, step.Run());
  EXPECT_EQ(*output.Get("connected"), Value(true));
  EXPECT_EQ(step.LastContext(), *bound);
}

TEST(StepTest, RevalidatesForADifferentContext) {
  auto step = MakeStep("connect", ConnectionScript());
  ASSERT_OK(step->Validate(ConnectionContext()));
  ASSERT_RAISES(KeyError, step->Execute(Context()));
  EXPECT_EQ(step->NumExecutions(), 0);
}

TEST(StepTest, ConcurrentRunsKeepTheirOwnContext) {
  AddStep step("add");
  constexpr int kRuns = 8;
  std::vector<Result<Output>> results(kRuns, Status::UnknownError("not run"));
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; ++i) {
    threads.emplace_back([&step, &results, i]() {
      Context ctx(Mapping{{"add", Value(Mapping{{"increment", Value(i)}})}});
      for (int round = 0; round < 50; ++round) {
        if (auto st = step.Validate(ctx); !st.ok()) {
          results[i] = st;
          return;
        }
        results[i] = step.Execute(ctx);
        if (!results[i].ok()) {
          return;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (int i = 0; i < kRuns; ++i) {
    ASSERT_OK_AND_ASSIGN(auto output, results[i]);
    EXPECT_EQ(*output.Get("value"), Value(i));
  }
  ASSERT_RAISES(KeyError, step.Execute(Context()));
}

TEST(StepTest, IdempotentStepYieldsIdenticalOutput) {
  AddStep step("add");
  Context ctx(Mapping{{"add", Value(Mapping{{"increment", Value(5)}})}});
  Output input;
  input.Set("value", 10);
  ASSERT_TRUE(step.IsIdempotent());

  ASSERT_OK_AND_ASSIGN(auto first, step.Execute(ctx, input));
  ASSERT_OK_AND_ASSIGN(auto second, step.Execute(ctx, input));
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.ToString(), second.ToString());
  EXPECT_EQ(*first.Get("value"), Value(15));
}

}  // namespace sl::test
