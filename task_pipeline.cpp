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
// Ordered list of named bring-up steps which device families can edit before it is executed.
#define PIPELINE_MODULE "task_pipeline.cpp"
#include "logging.h"
#include "task_pipeline.h"


static std::string joinStepIds(const std::string& parentId, const std::string& childId)
{
    if (childId.empty())
    {
        return parentId;
    }
    return parentId + "." + childId;
}


TaskPipeline::TaskPipeline()
: m_isLocked(false)
{
}

bool TaskPipeline::append(const std::string& id, TaskFunction function)
{
    return insertAt(m_steps.size(), id, function);
}

bool TaskPipeline::appendNested(const std::string& id, const TaskPipeline& nested)
{
    if (!checkCanAdd(id, "appendNested"))
    {
        return false;
    }

    TaskStep step;
    step.id = id;
    step.kind = TASK_NESTED;
    step.pNested = std::make_shared<TaskPipeline>(nested);
    m_steps.push_back(step);
    return true;
}

bool TaskPipeline::appendGenerator(const std::string& id, PipelineGenerator generator)
{
    if (!checkCanAdd(id, "appendGenerator"))
    {
        return false;
    }
    if (!generator)
    {
        return setError(ERROR_INVALID_ARGUMENT, "appendGenerator", id);
    }

    TaskStep step;
    step.id = id;
    step.kind = TASK_GENERATOR;
    step.generator = generator;
    m_steps.push_back(step);
    return true;
}

bool TaskPipeline::insertBefore(const std::string& anchor, const std::string& id, TaskFunction function)
{
    if (!checkCanEdit("insertBefore"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(anchor);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "insertBefore", anchor);
    }
    return insertAt(it - m_steps.begin(), id, function);
}

bool TaskPipeline::insertAfter(const std::string& anchor, const std::string& id, TaskFunction function)
{
    if (!checkCanEdit("insertAfter"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(anchor);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "insertAfter", anchor);
    }
    return insertAt(it - m_steps.begin() + 1, id, function);
}

bool TaskPipeline::insertAt(size_t index, const std::string& id, TaskFunction function)
{
    if (!checkCanAdd(id, "insert"))
    {
        return false;
    }
    if (!function)
    {
        return setError(ERROR_INVALID_ARGUMENT, "insert", id);
    }

    TaskStep step;
    step.id = id;
    step.kind = TASK_PLAIN;
    step.function = function;
    m_steps.insert(m_steps.begin() + index, step);
    return true;
}

bool TaskPipeline::wrap(const std::string& target, TaskWrapper wrapper)
{
    if (!checkCanEdit("wrap"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(target);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "wrap", target);
    }
    if (it->kind == TASK_NESTED || it->kind == TASK_GENERATOR)
    {
        logErrorF("Step '%s' holds a pipeline and must be edited with modifyNested() instead.", target.c_str());
        return setError(ERROR_INVALID_ARGUMENT, "wrap", target);
    }

    std::shared_ptr<TaskStep> pInner = std::make_shared<TaskStep>(*it);
    TaskFunction wrapped = wrapper(pInner->function);
    if (!wrapped)
    {
        logErrorF("Wrapper for step '%s' didn't return a step function.", target.c_str());
        return setError(ERROR_INVALID_ARGUMENT, "wrap", target);
    }
    it->function = wrapped;
    it->kind = TASK_WRAPPED;
    it->pInner = pInner;
    return true;
}

bool TaskPipeline::replace(const std::string& target, TaskFunction function)
{
    if (!checkCanEdit("replace"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(target);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "replace", target);
    }
    if (!function)
    {
        return setError(ERROR_INVALID_ARGUMENT, "replace", target);
    }

    TaskStep step;
    step.id = target;
    step.kind = TASK_REPLACED;
    step.function = function;
    *it = step;
    return true;
}

bool TaskPipeline::modifyNested(const std::string& target, PipelineEditor editor)
{
    if (!checkCanEdit("modifyNested"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(target);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "modifyNested", target);
    }

    switch (it->kind)
    {
    case TASK_NESTED:
        if (!editor(*it->pNested))
        {
            ErrorCode code = it->pNested->getLastError().code;
            return setError(code != ERROR_NONE ? code : ERROR_INVALID_ARGUMENT, "modifyNested",
                            joinStepIds(target, it->pNested->getLastError().step));
        }
        return true;
    case TASK_GENERATOR:
        // The generated pipeline doesn't exist until the step runs so queue up the edit until then.
        it->editors.push_back(editor);
        return true;
    default:
        logErrorF("Step '%s' doesn't hold a pipeline to be modified.", target.c_str());
        return setError(ERROR_INVALID_ARGUMENT, "modifyNested", target);
    }
}

bool TaskPipeline::remove(const std::string& target)
{
    if (!checkCanEdit("remove"))
    {
        return false;
    }
    std::vector<TaskStep>::iterator it = findStep(target);
    if (it == m_steps.end())
    {
        return setError(ERROR_STEP_NOT_FOUND, "remove", target);
    }
    m_steps.erase(it);
    return true;
}

bool TaskPipeline::hasStep(const std::string& id) const
{
    return findStep(id) != m_steps.end();
}

std::vector<std::string> TaskPipeline::getStepNames() const
{
    std::vector<std::string> names;
    names.reserve(m_steps.size());
    for (size_t i = 0 ; i < m_steps.size() ; i++)
    {
        names.push_back(m_steps[i].id);
    }
    return names;
}

bool TaskPipeline::getStepKind(const std::string& id, TaskKind* pKind) const
{
    std::vector<TaskStep>::const_iterator it = findStep(id);
    if (it == m_steps.end())
    {
        return false;
    }
    *pKind = it->kind;
    return true;
}

bool TaskPipeline::execute()
{
    if (m_isLocked)
    {
        logError("Pipeline has already been executed.");
        return setError(ERROR_PIPELINE_LOCKED, "execute", "");
    }
    m_isLocked = true;
    m_lastError = ErrorInfo();

    for (size_t i = 0 ; i < m_steps.size() ; i++)
    {
        TaskStep& step = m_steps[i];

        logDebugF("Running step '%s'.", step.id.c_str());
        if (step.kind == TASK_NESTED)
        {
            if (!runSubPipeline(*step.pNested, step.id))
            {
                return false;
            }
            continue;
        }

        ErrorCode result = runStep(step);
        if (result != ERROR_NONE)
        {
            // A failed generated pipeline has already recorded the failing step.
            if (m_lastError.code == ERROR_NONE)
            {
                setError(result, "execute", step.id);
            }
            logErrorF("Step '%s' failed with %s.", m_lastError.step.c_str(), errorCodeName(m_lastError.code));
            return false;
        }
    }
    return true;
}

ErrorCode TaskPipeline::runStep(TaskStep& step)
{
    if (step.kind != TASK_GENERATOR)
    {
        return step.function();
    }

    TaskPipeline generated;
    ErrorCode result = step.generator(generated);
    if (result != ERROR_NONE)
    {
        return result;
    }
    for (size_t i = 0 ; i < step.editors.size() ; i++)
    {
        if (!step.editors[i](generated))
        {
            ErrorCode code = generated.getLastError().code;
            setError(code != ERROR_NONE ? code : ERROR_INVALID_ARGUMENT, "modifyNested",
                     joinStepIds(step.id, generated.getLastError().step));
            return m_lastError.code;
        }
    }
    if (!runSubPipeline(generated, step.id))
    {
        return m_lastError.code;
    }
    return ERROR_NONE;
}

bool TaskPipeline::runSubPipeline(TaskPipeline& pipeline, const std::string& parentId)
{
    if (pipeline.execute())
    {
        return true;
    }

    const ErrorInfo& nestedError = pipeline.getLastError();
    m_lastError = nestedError;
    m_lastError.step = joinStepIds(parentId, nestedError.step);
    return false;
}

bool TaskPipeline::checkCanEdit(const char* pOperation)
{
    if (m_isLocked)
    {
        logErrorF("Can't %s() once the pipeline has started executing.", pOperation);
        return setError(ERROR_PIPELINE_LOCKED, pOperation, "");
    }
    return true;
}

bool TaskPipeline::checkCanAdd(const std::string& id, const char* pOperation)
{
    if (!checkCanEdit(pOperation))
    {
        return false;
    }
    if (hasStep(id))
    {
        logErrorF("Step '%s' already exists in the pipeline.", id.c_str());
        return setError(ERROR_DUPLICATE_STEP, pOperation, id);
    }
    return true;
}

std::vector<TaskPipeline::TaskStep>::iterator TaskPipeline::findStep(const std::string& id)
{
    for (std::vector<TaskStep>::iterator it = m_steps.begin() ; it != m_steps.end() ; ++it)
    {
        if (it->id == id)
        {
            return it;
        }
    }
    return m_steps.end();
}

std::vector<TaskPipeline::TaskStep>::const_iterator TaskPipeline::findStep(const std::string& id) const
{
    for (std::vector<TaskStep>::const_iterator it = m_steps.begin() ; it != m_steps.end() ; ++it)
    {
        if (it->id == id)
        {
            return it;
        }
    }
    return m_steps.end();
}

bool TaskPipeline::setError(ErrorCode code, const char* pOperation, const std::string& step)
{
    m_lastError = ErrorInfo(code, pOperation);
    m_lastError.step = step;
    return false;
}
