#pragma once

#include <QJsonObject>
#include <QString>

class ConversionPlan;

namespace PlanReport {

// Multi-line human-readable description of a plan
QString renderText(const ConversionPlan& plan, bool overwrite);
// Same content as a JSON object; absent values are null
QJsonObject renderJson(const ConversionPlan& plan, bool overwrite);

} // namespace PlanReport
