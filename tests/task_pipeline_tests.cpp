/* Copyright 2024 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "task_pipeline.h"


class TaskPipelineTest : public ::testing::Test
{
protected:
    TaskFunction record(const std::string& name, ErrorCode result = ERROR_NONE)
    {
        return [this, name, result]() { m_log.push_back(name); return result; };
    }

    TaskPipeline                m_pipeline;
    std::vector<std::string>    m_log;
};

//============================================================================
// Construction and editing
//============================================================================

TEST_F(TaskPipelineTest, StepsRunOnceInDeclaredOrder)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("b", record("b")));
    ASSERT_TRUE(m_pipeline.append("c", record("c")));

    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "a", "b", "c" }), m_log);
}

TEST_F(TaskPipelineTest, InsertBeforeAndAfterAnchors)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("c", record("c")));
    ASSERT_TRUE(m_pipeline.insertBefore("c", "b", record("b")));
    ASSERT_TRUE(m_pipeline.insertAfter("c", "d", record("d")));
    ASSERT_TRUE(m_pipeline.insertBefore("a", "start", record("start")));

    EXPECT_EQ((std::vector<std::string>{ "start", "a", "b", "c", "d" }), m_pipeline.getStepNames());
    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "start", "a", "b", "c", "d" }), m_log);
}

TEST_F(TaskPipelineTest, InsertWithMissingAnchorFailsWithStepNotFound)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));

    EXPECT_FALSE(m_pipeline.insertBefore("missing", "b", record("b")));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.insertAfter("missing", "b", record("b")));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.hasStep("b"));
    EXPECT_EQ(1U, m_pipeline.getStepCount());
}

TEST_F(TaskPipelineTest, DuplicateIdFailsWithDuplicateStep)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("b", record("b")));

    EXPECT_FALSE(m_pipeline.append("a", record("a2")));
    EXPECT_EQ(ERROR_DUPLICATE_STEP, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.insertAfter("a", "b", record("b2")));
    EXPECT_EQ(ERROR_DUPLICATE_STEP, m_pipeline.getLastError().code);
    EXPECT_EQ(2U, m_pipeline.getStepCount());
}

TEST_F(TaskPipelineTest, WrappedStepRunsInnerExactlyOnce)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.wrap("a", [this](TaskFunction inner) -> TaskFunction
    {
        return [this, inner]()
        {
            m_log.push_back("before");
            ErrorCode result = inner();
            m_log.push_back("after");
            return result;
        };
    }));

    TaskKind kind = TASK_PLAIN;
    ASSERT_TRUE(m_pipeline.getStepKind("a", &kind));
    EXPECT_EQ(TASK_WRAPPED, kind);
    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "before", "a", "after" }), m_log);
}

TEST_F(TaskPipelineTest, WrapMissingStepFails)
{
    EXPECT_FALSE(m_pipeline.wrap("missing", [](TaskFunction inner) { return inner; }));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);
}

TEST_F(TaskPipelineTest, WrapperReturningEmptyFunctionIsRejected)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));

    EXPECT_FALSE(m_pipeline.wrap("a", [](TaskFunction inner) { return TaskFunction(); }));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, m_pipeline.getLastError().code);
    EXPECT_EQ("a", m_pipeline.getLastError().step);

    // The original step is left in place.
    TaskKind kind = TASK_WRAPPED;
    ASSERT_TRUE(m_pipeline.getStepKind("a", &kind));
    EXPECT_EQ(TASK_PLAIN, kind);
    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "a" }), m_log);
}

TEST_F(TaskPipelineTest, EmptyStepFunctionsAreRejected)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));

    EXPECT_FALSE(m_pipeline.append("b", TaskFunction()));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.replace("a", TaskFunction()));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.appendGenerator("gen", PipelineGenerator()));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, m_pipeline.getLastError().code);
    EXPECT_EQ(1U, m_pipeline.getStepCount());
}

TEST_F(TaskPipelineTest, ReplaceKeepsPosition)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("b", record("b")));
    ASSERT_TRUE(m_pipeline.append("c", record("c")));

    ASSERT_TRUE(m_pipeline.replace("b", record("new_b")));

    TaskKind kind = TASK_PLAIN;
    ASSERT_TRUE(m_pipeline.getStepKind("b", &kind));
    EXPECT_EQ(TASK_REPLACED, kind);
    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "a", "new_b", "c" }), m_log);
}

TEST_F(TaskPipelineTest, RemoveStep)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("b", record("b")));

    EXPECT_TRUE(m_pipeline.remove("a"));
    EXPECT_FALSE(m_pipeline.hasStep("a"));
    EXPECT_FALSE(m_pipeline.remove("a"));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);
    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "b" }), m_log);
}

//============================================================================
// Execution
//============================================================================

TEST_F(TaskPipelineTest, FailingStepStopsExecutionAndIsReported)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.append("b", record("b", ERROR_TRANSFER_FAULT)));
    ASSERT_TRUE(m_pipeline.append("c", record("c")));

    EXPECT_FALSE(m_pipeline.execute());
    EXPECT_EQ(ERROR_TRANSFER_FAULT, m_pipeline.getLastError().code);
    EXPECT_EQ("b", m_pipeline.getLastError().step);
    EXPECT_EQ((std::vector<std::string>{ "a", "b" }), m_log);
}

TEST_F(TaskPipelineTest, EditsAfterExecuteAreRejected)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.execute());
    EXPECT_TRUE(m_pipeline.isLocked());

    EXPECT_FALSE(m_pipeline.append("b", record("b")));
    EXPECT_EQ(ERROR_PIPELINE_LOCKED, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.replace("a", record("a2")));
    EXPECT_EQ(ERROR_PIPELINE_LOCKED, m_pipeline.getLastError().code);
    EXPECT_FALSE(m_pipeline.remove("a"));
    EXPECT_EQ(ERROR_PIPELINE_LOCKED, m_pipeline.getLastError().code);
}

TEST_F(TaskPipelineTest, SecondExecuteIsRejected)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.execute());

    EXPECT_FALSE(m_pipeline.execute());
    EXPECT_EQ(ERROR_PIPELINE_LOCKED, m_pipeline.getLastError().code);
    EXPECT_EQ(1U, m_log.size());
}

//============================================================================
// Nested and generated pipelines
//============================================================================

TEST_F(TaskPipelineTest, NestedPipelineRunsInPlace)
{
    TaskPipeline nested;
    ASSERT_TRUE(nested.append("x", record("x")));
    ASSERT_TRUE(nested.append("y", record("y")));
    ASSERT_TRUE(m_pipeline.append("a", record("a")));
    ASSERT_TRUE(m_pipeline.appendNested("inner", nested));
    ASSERT_TRUE(m_pipeline.append("b", record("b")));

    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "a", "x", "y", "b" }), m_log);
}

TEST_F(TaskPipelineTest, ModifyNestedEditsImmediately)
{
    TaskPipeline nested;
    ASSERT_TRUE(nested.append("x", record("x")));
    ASSERT_TRUE(m_pipeline.appendNested("inner", nested));

    EXPECT_TRUE(m_pipeline.modifyNested("inner", [this](TaskPipeline& inner)
    {
        return inner.insertBefore("x", "w", record("w"));
    }));
    EXPECT_FALSE(m_pipeline.modifyNested("inner", [this](TaskPipeline& inner)
    {
        return inner.insertBefore("missing", "v", record("v"));
    }));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);

    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "w", "x" }), m_log);
}

TEST_F(TaskPipelineTest, ModifyNestedOnPlainStepFails)
{
    ASSERT_TRUE(m_pipeline.append("a", record("a")));

    EXPECT_FALSE(m_pipeline.modifyNested("a", [](TaskPipeline& inner) { return true; }));
    EXPECT_FALSE(m_pipeline.modifyNested("missing", [](TaskPipeline& inner) { return true; }));
    EXPECT_EQ(ERROR_STEP_NOT_FOUND, m_pipeline.getLastError().code);
}

TEST_F(TaskPipelineTest, WrapOfNestedStepIsRejected)
{
    TaskPipeline nested;
    ASSERT_TRUE(m_pipeline.appendNested("inner", nested));

    EXPECT_FALSE(m_pipeline.wrap("inner", [](TaskFunction inner) { return inner; }));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, m_pipeline.getLastError().code);
}

TEST_F(TaskPipelineTest, GeneratedPipelineRunsImmediatelyAfterGenerator)
{
    ASSERT_TRUE(m_pipeline.appendGenerator("gen", [this](TaskPipeline& generated)
    {
        m_log.push_back("gen");
        generated.append("g.1", record("g.1"));
        generated.append("g.2", record("g.2"));
        return ERROR_NONE;
    }));
    ASSERT_TRUE(m_pipeline.append("after", record("after")));

    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "gen", "g.1", "g.2", "after" }), m_log);
}

TEST_F(TaskPipelineTest, ModifyNestedOnGeneratorAppliesToGeneratedPipeline)
{
    ASSERT_TRUE(m_pipeline.appendGenerator("gen", [this](TaskPipeline& generated)
    {
        generated.append("init.0", record("init.0"));
        generated.append("init.1", record("init.1"));
        return ERROR_NONE;
    }));
    ASSERT_TRUE(m_pipeline.modifyNested("gen", [this](TaskPipeline& generated)
    {
        if (!generated.hasStep("init.1"))
        {
            return true;
        }
        return generated.insertBefore("init.1", "prepare.1", record("prepare.1"));
    }));

    EXPECT_TRUE(m_pipeline.execute());
    EXPECT_EQ((std::vector<std::string>{ "init.0", "prepare.1", "init.1" }), m_log);
}

TEST_F(TaskPipelineTest, FailureInNestedPipelineReportsDottedStep)
{
    TaskPipeline nested;
    ASSERT_TRUE(nested.append("find_aps", record("find_aps", ERROR_TRANSPORT)));
    ASSERT_TRUE(nested.append("create_aps", record("create_aps")));
    ASSERT_TRUE(m_pipeline.appendNested("discovery", nested));
    ASSERT_TRUE(m_pipeline.append("post", record("post")));

    EXPECT_FALSE(m_pipeline.execute());
    EXPECT_EQ(ERROR_TRANSPORT, m_pipeline.getLastError().code);
    EXPECT_EQ("discovery.find_aps", m_pipeline.getLastError().step);
    EXPECT_EQ((std::vector<std::string>{ "find_aps" }), m_log);
}

TEST_F(TaskPipelineTest, FailureInGeneratedPipelineReportsDottedStep)
{
    ASSERT_TRUE(m_pipeline.appendGenerator("gen", [this](TaskPipeline& generated)
    {
        generated.append("init.3", record("init.3", ERROR_TRANSFER_TIMEOUT));
        return ERROR_NONE;
    }));

    EXPECT_FALSE(m_pipeline.execute());
    EXPECT_EQ(ERROR_TRANSFER_TIMEOUT, m_pipeline.getLastError().code);
    EXPECT_EQ("gen.init.3", m_pipeline.getLastError().step);
}
