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
#include <stepline/task.h>

#include <arrow/testing/gtest_util.h>
#include <arrow/util/cancel.h>

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_steps.h"

namespace sl::test {

namespace {

Script Emitting(const std::string& field, Value value) {
  Script script;
  script.emit.Set(field, std::move(value));
  return script;
}

Context IncrementContext() {
  return Context(Mapping{{"one", Value(Mapping{{"increment", Value(1)}})},
                         {"ten", Value(Mapping{{"increment", Value(10)}})},
                         {"hundred", Value(Mapping{{"increment", Value(100)}})}});
}

}  // namespace

TEST(TaskTest, ChildrenRunInOrderAndChain) {
  Task task("sum", std::vector<std::shared_ptr<Step>>{std::make_shared<AddStep>("one"),
                                                      std::make_shared<AddStep>("ten"),
                                                      std::make_shared<AddStep>("hundred")});
  ASSERT_EQ(task.NumChildren(), 3);

  Output input;
  input.Set("value", 1000);
  ASSERT_OK_AND_ASSIGN(auto output, task.Execute(IncrementContext(), input));
  EXPECT_EQ(*output.Get("value"), Value(1111));
  EXPECT_EQ(task.State(), StepState::SUCCEEDED);
}

TEST(TaskTest, FailureAbortsRemainingChildren) {
  auto log = std::make_shared<CallLog>();
  auto s1 = MakeStep("S1", Emitting("s1", 1), log);
  auto s2 = MakeFailingStep("S2", Status::IOError("disk full"), log);
  auto s3 = MakeStep("S3", Emitting("s3", 3), log);
  Task task("T", std::vector<std::shared_ptr<Step>>{s1, s2, s3});

  auto result = task.Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_EQ(s3->NumExecutions(), 0);
  EXPECT_EQ(log->Calls(), (std::vector<std::string>{"S1", "S2"}));
  EXPECT_EQ(task.State(), StepState::FAILED);

  const auto& st = result.status();
  ASSERT_EQ(GetErrorKind(st), ErrorKind::COMPOSITION);
  auto detail = GetDetail<CompositionDetail>(st);
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Task(), "T");
  EXPECT_EQ(detail->Child(), "S2");
  EXPECT_EQ(detail->Position(), 2);
  EXPECT_EQ(detail->Completed(), (std::vector<std::string>{"S1"}));
  ASSERT_EQ(detail->Trace().size(), 1);
  EXPECT_EQ(detail->Trace()[0].name, "S1");
  EXPECT_EQ(*detail->Trace()[0].output.Get("s1"), Value(1));

  EXPECT_TRUE(RootCause(st).IsIOError());
  EXPECT_EQ(FailingUnit(st), "S2");
  ASSERT_EQ(task.LastTrace().size(), 1);
  EXPECT_EQ(task.LastTrace()[0].position, 1);
}

TEST(TaskTest, NestedFailureUnwindsToLeaf) {
  auto log = std::make_shared<CallLog>();
  auto s_a = MakeStep("S_a", Emitting("a", 1), log);
  auto s_b = MakeFailingStep("S_b", Status::Invalid("bad record"), log);
  auto s_x = MakeStep("S_x", Emitting("x", 1), log);
  auto inner = std::make_shared<Task>("T_inner", std::vector<std::shared_ptr<Step>>{s_a, s_b});
  Task outer("T_outer", std::vector<std::shared_ptr<Step>>{inner, s_x});

  auto result = outer.Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_EQ(s_x->NumExecutions(), 0);
  EXPECT_EQ(log->Calls(), (std::vector<std::string>{"S_a", "S_b"}));

  const auto& st = result.status();
  EXPECT_EQ(FailingUnit(st), "S_b");
  auto frames = UnwindErrors(st);
  ASSERT_EQ(frames.size(), 4);
  EXPECT_EQ(frames[0].unit, "T_outer");
  EXPECT_EQ(frames[0].position, 1);
  EXPECT_EQ(frames[1].unit, "T_inner");
  EXPECT_EQ(frames[1].position, 2);
  EXPECT_EQ(frames[2].kind, ErrorKind::EXECUTION);
  EXPECT_EQ(frames[2].unit, "S_b");
  EXPECT_TRUE(RootCause(st).IsInvalid());

  auto inner_detail = GetDetail<CompositionDetail>(CauseOf(st));
  ASSERT_NE(inner_detail, nullptr);
  EXPECT_EQ(inner_detail->Completed(), (std::vector<std::string>{"S_a"}));
}

TEST(TaskTest, ChildConfigFailureIsWrapped) {
  Script needs_path;
  needs_path.config = {{"sink.path", ValueKind::STRING}};
  auto first = MakeStep("first", Emitting("a", 1));
  auto second = MakeStep("second", needs_path);
  Task task("T", std::vector<std::shared_ptr<Step>>{first, second});

  auto result = task.Execute(Context());
  ASSERT_RAISES(KeyError, result);
  auto detail = GetDetail<CompositionDetail>(result.status());
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Position(), 2);
  EXPECT_EQ(GetErrorKind(detail->Cause()), ErrorKind::CONFIG_RESOLUTION);
  EXPECT_EQ(FailingUnit(result.status()), "second");
  EXPECT_EQ(second->NumExecutions(), 0);
}

TEST(TaskTest, ValidateAllIsARecursiveDryRun) {
  Script needs_path;
  needs_path.config = {{"sink.path", ValueKind::STRING}};
  auto leaf = MakeStep("leaf", needs_path);
  auto inner = std::make_shared<Task>(
      "inner", std::vector<std::shared_ptr<Step>>{MakeStep("noop"), leaf});
  Task outer("outer", std::vector<std::shared_ptr<Step>>{inner});

  // A task declares nothing of its own.
  ASSERT_OK(outer.Validate(Context()));

  auto st = outer.ValidateAll(Context());
  ASSERT_RAISES(KeyError, st);
  EXPECT_EQ(FailingUnit(st), "leaf");
  EXPECT_EQ(leaf->NumExecutions(), 0);

  ASSERT_OK(outer.ValidateAll(Context(Mapping{{"sink", Value(Mapping{{"path", Value("/x")}})}})));
}

TEST(TaskTest, EmptyTaskReturnsInput) {
  Task task("empty");
  Output input;
  input.Set("k", "v");
  ASSERT_OK_AND_ASSIGN(auto output, task.Execute(Context(), input));
  EXPECT_EQ(output, input);
  EXPECT_TRUE(output.Trace().empty());
}

TEST(TaskTest, OutputPolicies) {
  auto make_children = []() {
    return std::vector<std::shared_ptr<Step>>{MakeStep("a", Emitting("a", 1)),
                                              MakeStep("b", Emitting("b", 2))};
  };

  Task last("last", make_children());
  ASSERT_OK_AND_ASSIGN(auto last_output, last.Execute(Context()));
  EXPECT_EQ(last_output.Size(), 1);
  EXPECT_EQ(*last_output.Get("b"), Value(2));

  Task merged("merged", make_children(), TaskOptions{OutputPolicy::MERGE_ALL});
  ASSERT_OK_AND_ASSIGN(auto merged_output, merged.Execute(Context()));
  EXPECT_EQ(merged_output.Size(), 2);
  EXPECT_EQ(*merged_output.Get("a"), Value(1));
  EXPECT_EQ(*merged_output.Get("b"), Value(2));
}

TEST(TaskTest, EarlierFieldsReachLaterChildren) {
  auto producer = MakeStep("producer", Emitting("token", "abc"));
  Script consumes;
  consumes.input = {{"token", ValueKind::STRING}};
  auto consumer = MakeStep("consumer", consumes);
  Task task("T", std::vector<std::shared_ptr<Step>>{producer, consumer});

  Output input;
  input.Set("seed", 1);
  ASSERT_OK(task.Execute(Context(), input).status());
  EXPECT_EQ(*consumer->LastInput().Get("token"), Value("abc"));
  EXPECT_EQ(*consumer->LastInput().Get("seed"), Value(1));
}

TEST(TaskTest, TraceRecording) {
  Task task("traced", std::vector<std::shared_ptr<Step>>{MakeStep("a", Emitting("a", 1)),
                                                         MakeStep("b", Emitting("b", 2))});
  ASSERT_OK_AND_ASSIGN(auto output, task.Execute(Context()));
  ASSERT_EQ(output.Trace().size(), 2);
  EXPECT_EQ(output.Trace()[0].name, "a");
  EXPECT_EQ(output.Trace()[1].position, 2);
  EXPECT_EQ(*output.Trace()[1].output.Get("b"), Value(2));
  EXPECT_EQ(task.LastTrace().size(), 2);

  Task untraced("untraced",
                std::vector<std::shared_ptr<Step>>{MakeStep("a", Emitting("a", 1)),
                                                   MakeFailingStep("b", Status::IOError("x"))},
                TaskOptions{OutputPolicy::LAST_WINS, /*record_trace=*/false});
  auto result = untraced.Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_TRUE(GetDetail<CompositionDetail>(result.status())->Trace().empty());
  EXPECT_EQ(GetDetail<CompositionDetail>(result.status())->Completed(),
            (std::vector<std::string>{"a"}));
}

TEST(TaskTest, CancellationBetweenChildren) {
  ::arrow::StopSource source;
  Script stops = Emitting("first", 1);
  stops.on_execute = [&source](const Context&, const Output&) { source.RequestStop(); };
  auto first = MakeStep("first", stops);
  auto second = MakeStep("second");
  Task task("T", std::vector<std::shared_ptr<Step>>{first, second});

  auto result = task.Execute(Context(), Output(), ExecContext{source.token()});
  ASSERT_RAISES(Cancelled, result);
  EXPECT_EQ(second->NumExecutions(), 0);
  auto detail = GetDetail<CancelledDetail>(result.status());
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(detail->Unit(), "T");
  EXPECT_EQ(detail->NextPosition(), 2);
  EXPECT_EQ(detail->Completed(), (std::vector<std::string>{"first"}));
  EXPECT_EQ(task.LastTrace().size(), 1);
}

TEST(TaskTest, CancellationInsideNestedTask) {
  ::arrow::StopSource source;
  Script stops;
  stops.on_execute = [&source](const Context&, const Output&) { source.RequestStop(); };
  auto inner = std::make_shared<Task>(
      "inner", std::vector<std::shared_ptr<Step>>{MakeStep("a", stops), MakeStep("b")});
  auto after = MakeStep("after");
  Task outer("outer", std::vector<std::shared_ptr<Step>>{inner, after});

  auto result = outer.Execute(Context(), Output(), ExecContext{source.token()});
  ASSERT_RAISES(Cancelled, result);
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::COMPOSITION);
  EXPECT_EQ(GetErrorKind(CauseOf(result.status())), ErrorKind::CANCELLED);
  EXPECT_EQ(after->NumExecutions(), 0);
}

TEST(TaskTest, ChildScopeAndOverrides) {
  auto reader = MakeStep("reader");
  auto writer = MakeStep("writer");
  Task task("T", std::vector<Task::Child>{
                     Task::Child{reader, std::string("source"), {}},
                     Task::Child{writer, std::nullopt, Mapping{{"mode", Value("append")}}},
                 });
  Context ctx(Mapping{{"source", Value(Mapping{{"location", Value("/in")}})},
                      {"mode", Value("overwrite")}});

  ASSERT_OK(task.Execute(ctx).status());
  EXPECT_EQ(reader->LastContext().Get("location"), Value("/in"));
  EXPECT_FALSE(reader->LastContext().Contains("mode"));
  EXPECT_EQ(writer->LastContext().Get("mode"), Value("append"));
  EXPECT_EQ(writer->LastContext().Get("source.location"), Value("/in"));
  // The task's own context is untouched.
  EXPECT_EQ(ctx.Get("mode"), Value("overwrite"));
}

TEST(TaskTest, MissingScopeIsWrapped) {
  Task task("T", std::vector<Task::Child>{Task::Child{MakeStep("reader"), "absent", {}}});
  auto result = task.Execute(Context());
  ASSERT_RAISES(KeyError, result);
  EXPECT_EQ(GetDetail<CompositionDetail>(result.status())->Child(), "reader");
}

TEST(TaskTest, ThrowingChildIsWrapped) {
  Script throws;
  throws.throws = true;
  Task task("T", std::vector<std::shared_ptr<Step>>{MakeStep("boom", throws)});
  auto result = task.Execute(Context());
  ASSERT_RAISES(ExecutionError, result);
  EXPECT_TRUE(RootCause(result.status()).IsUnknownError());
}

TEST(TaskTest, ChildrenAreFixedAfterFirstRun) {
  Task task("T");
  ASSERT_OK(task.Add(MakeStep("a")));
  ASSERT_RAISES(Invalid, task.Add(std::shared_ptr<Step>()));
  ASSERT_OK(task.Execute(Context()).status());
  ASSERT_RAISES(Invalid, task.Add(MakeStep("b")));
  EXPECT_EQ(task.NumChildren(), 1);
  EXPECT_EQ(task.GetChild(0).unit->Name(), "a");
}

TEST(TaskTest, NullChildAtConstructionIsRejected) {
  auto kept = MakeStep("kept");
  Task task("T", std::vector<std::shared_ptr<Step>>{kept, nullptr});
  EXPECT_EQ(task.NumChildren(), 1);
  EXPECT_EQ(task.Description(), "Task of 1 children: kept");

  auto st = task.Validate(Context());
  ASSERT_RAISES(Invalid, st);
  EXPECT_EQ(GetErrorKind(st), ErrorKind::VALIDATION);
  ASSERT_RAISES(Invalid, task.ValidateAll(Context()));
  ASSERT_RAISES(Invalid, task.Execute(Context()));
  EXPECT_EQ(kept->NumExecutions(), 0);

  Task from_children("U", std::vector<Task::Child>{Task::Child{nullptr, std::nullopt, {}}});
  EXPECT_EQ(from_children.NumChildren(), 0);
  ASSERT_RAISES(Invalid, from_children.Execute(Context()));
}

TEST(TaskTest, IndirectCycleIsRejected) {
  auto a = std::make_shared<Task>("a");
  auto b = std::make_shared<Task>("b");
  auto c = std::make_shared<Task>("c");
  ASSERT_OK(a->Add(b));
  ASSERT_OK(b->Add(c));
  ASSERT_RAISES(Invalid, b->Add(a));
  ASSERT_RAISES(Invalid, c->Add(a));
  ASSERT_RAISES(Invalid, c->Add(b));
  EXPECT_TRUE(a->Reaches(c.get()));
  EXPECT_FALSE(c->Reaches(a.get()));

  // Sharing a leaf between branches is not a cycle.
  auto leaf = MakeStep("leaf", Emitting("x", 1));
  ASSERT_OK(b->Add(leaf));
  ASSERT_OK(c->Add(leaf));

  ASSERT_OK_AND_ASSIGN(auto output, a->Execute(Context()));
  EXPECT_EQ(*output.Get("x"), Value(1));
  EXPECT_EQ(leaf->NumExecutions(), 2);
  EXPECT_EQ(a->Description(), "Task of 1 children: b");
}

TEST(TaskTest, IdempotencyAndDescription) {
  Task idempotent("sum", std::vector<std::shared_ptr<Step>>{std::make_shared<AddStep>("one"),
                                                            std::make_shared<AddStep>("ten")});
  EXPECT_TRUE(idempotent.IsIdempotent());
  EXPECT_EQ(idempotent.Description(), "Task of 2 children: one -> ten");

  Task mixed("mixed", std::vector<std::shared_ptr<Step>>{std::make_shared<AddStep>("one"),
                                                         MakeStep("side-effect")});
  EXPECT_FALSE(mixed.IsIdempotent());

  Output input;
  input.Set("value", 0);
  ASSERT_OK_AND_ASSIGN(auto first, idempotent.Execute(IncrementContext(), input));
  ASSERT_OK_AND_ASSIGN(auto second, idempotent.Execute(IncrementContext(), input));
  EXPECT_EQ(first, second);
}

}  // namespace sl::test
