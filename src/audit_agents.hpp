#pragma once

#include "agent.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace conductor {

// Built-in audit stages. They are stateless, so one instance can serve
// several runs at once. All data lives under the run's context subtree:
//
//   {run}/repo/path, {run}/repo/files, {run}/repo/languages    repo_cloner
//   {run}/security/findings, {run}/security/summary            security_scanner
//   {run}/code_review/summary                                  code_reviewer
//   {run}/report                                               reporter

// Snapshot the file inventory of a local checkout.
class repo_cloner final : public agent {
public:
    task_result run_task(task_context& ctx) override;
};

// Flag sensitive file names; with deep_analysis also scan contents for secrets.
class security_scanner final : public agent {
public:
    task_result run_task(task_context& ctx) override;
};

// Line statistics, long lines and TODO markers per language.
class code_reviewer final : public agent {
public:
    task_result run_task(task_context& ctx) override;
};

// Combine whatever the analyzers produced into one report.
class reporter final : public agent {
public:
    task_result run_task(task_context& ctx) override;
};

// Language name for a file extension (".py" -> "python"), empty if not code.
std::string language_for(const std::string& extension);

// True if the file name looks like configuration or secret material.
bool is_sensitive_file(const std::string& filename);

// "CRITICAL" > "HIGH" > "MEDIUM" > "LOW"
std::string overall_risk(const nlohmann::json& security_summary, double maintainability);

} // namespace conductor
