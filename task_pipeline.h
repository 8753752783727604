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
// Ordered list of named bring-up steps which device families can edit (insert, wrap, replace, remove) before it is
// executed.
//
// The generic bring-up procedure for a target is built as a TaskPipeline and then each device family applies its
// edits on top of it by referring to the steps by name. Once execute() has been called the pipeline is locked and
// any further edits fail with ERROR_PIPELINE_LOCKED. A pipeline can only be executed once.
//
// A step is one of:
//  * A plain function.
//  * A wrapped function. The wrapper was given the original step function and returned a new one which typically
//    calls the original from within.
//  * A replaced function.
//  * A nested pipeline which is executed in place of the step. modifyNested() edits it immediately.
//  * A generator which fills in a new pipeline when the step is reached at runtime. The generated pipeline is then
//    executed before moving on to the next step. modifyNested() edits queued against a generator step are applied to
//    each generated pipeline before it is executed.
#ifndef TASK_PIPELINE_H_
#define TASK_PIPELINE_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "errors.h"


class TaskPipeline;

// A step returns ERROR_NONE on success. Anything else stops the pipeline.
typedef std::function<ErrorCode()> TaskFunction;
// Given the existing step function, return the function to be run in its place.
typedef std::function<TaskFunction(TaskFunction inner)> TaskWrapper;
// Fill in the pipeline to be run for a generator step.
typedef std::function<ErrorCode(TaskPipeline& generated)> PipelineGenerator;
// Apply edits to a nested or generated pipeline. Return false if any of the edits failed.
typedef std::function<bool(TaskPipeline& pipeline)> PipelineEditor;

enum TaskKind
{
    TASK_PLAIN,
    TASK_WRAPPED,
    TASK_REPLACED,
    TASK_NESTED,
    TASK_GENERATOR
};


class TaskPipeline
{
public:
    TaskPipeline();

    // Add a step to the end of the pipeline.
    //
    // Returns true if successful.
    // Returns false if id is already used (ERROR_DUPLICATE_STEP) or the pipeline is locked (ERROR_PIPELINE_LOCKED).
    bool append(const std::string& id, TaskFunction function);
    bool appendNested(const std::string& id, const TaskPipeline& nested);
    bool appendGenerator(const std::string& id, PipelineGenerator generator);

    // Add a step immediately before/after the existing anchor step.
    //
    // Returns true if successful.
    // Returns false if the anchor doesn't exist (ERROR_STEP_NOT_FOUND), id is already used (ERROR_DUPLICATE_STEP),
    // or the pipeline is locked (ERROR_PIPELINE_LOCKED).
    bool insertBefore(const std::string& anchor, const std::string& id, TaskFunction function);
    bool insertAfter(const std::string& anchor, const std::string& id, TaskFunction function);

    // Replace the function of the target step with the one returned by the wrapper. The wrapper is called right
    // away with the current function of the step. Only plain, wrapped and replaced steps can be wrapped; use
    // modifyNested() for the other kinds (ERROR_INVALID_ARGUMENT).
    bool wrap(const std::string& target, TaskWrapper wrapper);

    // Replace the target step (of any kind) with a plain function, keeping its name and position.
    bool replace(const std::string& target, TaskFunction function);

    // Edit the pipeline of a nested or generator step. See the header comment for when the editor is run.
    bool modifyNested(const std::string& target, PipelineEditor editor);

    bool remove(const std::string& target);

    bool hasStep(const std::string& id) const;
    size_t getStepCount() const
    {
        return m_steps.size();
    }
    std::vector<std::string> getStepNames() const;
    bool getStepKind(const std::string& id, TaskKind* pKind) const;

    // Run each of the steps in order, stopping at the first one to fail.
    //
    // Returns true if all steps completed successfully.
    // Returns false otherwise and getLastError() holds the error and the id of the failing step. The id of a step in
    // a nested or generated pipeline is prefixed with the id of its parent step, "discovery.find_aps" for example.
    bool execute();

    bool isLocked() const
    {
        return m_isLocked;
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    struct TaskStep
    {
        TaskStep()
        : kind(TASK_PLAIN)
        {
        }

        std::string                     id;
        TaskKind                        kind;
        TaskFunction                    function;
        std::shared_ptr<TaskStep>       pInner;
        std::shared_ptr<TaskPipeline>   pNested;
        PipelineGenerator               generator;
        std::vector<PipelineEditor>     editors;
    };

    bool checkCanEdit(const char* pOperation);
    bool checkCanAdd(const std::string& id, const char* pOperation);
    bool insertAt(size_t index, const std::string& id, TaskFunction function);
    std::vector<TaskStep>::iterator findStep(const std::string& id);
    std::vector<TaskStep>::const_iterator findStep(const std::string& id) const;
    bool setError(ErrorCode code, const char* pOperation, const std::string& step);
    ErrorCode runStep(TaskStep& step);
    bool runSubPipeline(TaskPipeline& pipeline, const std::string& parentId);

    std::vector<TaskStep>   m_steps;
    ErrorInfo               m_lastError;
    bool                    m_isLocked;
};

#endif // TASK_PIPELINE_H_
