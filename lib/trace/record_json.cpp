// codetrace/trace/record_json.cpp - JSON form of decoded traces
#include "codetrace/trace/record_json.hpp"

namespace codetrace
{

namespace
{

using Json = nlohmann::ordered_json;

struct EventToJson
{
  Json & j;

  void operator()(const VariableEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["value"] = ev.value;
    j["address"] = ev.address;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const CallEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["args"] = ev.args;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const ExternalCallEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const ParamEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["value"] = ev.value;
    j["line_number"] = ev.line_number;
  }

  void operator()(const UpdateEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["operator"] = ev.op;
    j["value"] = ev.value;
    j["address"] = ev.address;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const ReturnEvent & ev) const
  {
    j["subtype"] = ev.subtype;
    j["value"] = ev.value;
    if (ev.address) {
      j["address"] = *ev.address;
    }
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const LoopEvent & ev) const
  {
    j["subtype"] = ev.subtype;
    if (ev.condition) {
      j["condition"] = *ev.condition;
    }
    if (ev.condition_result) {
      j["condition_result"] = *ev.condition_result;
    }
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const BranchEvent & ev) const
  {
    j["subtype"] = ev.subtype;
    j["condition"] = ev.condition;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const ConditionEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["condition_result"] = ev.condition_result;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const SwitchEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["value"] = ev.value;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const CaseEvent & ev) const
  {
    j["subject"] = ev.subject;
    j["line_number"] = ev.line_number;
    j["stack_depth"] = ev.stack_depth;
  }

  void operator()(const UnknownEvent & ev) const { j["args"] = ev.args; }
};

}  // namespace

nlohmann::ordered_json to_json(const TraceRecord & record)
{
  Json j = Json::object();
  j["type"] = std::string(tag_name(record.kind));
  std::visit(EventToJson{j}, record.event);
  j["id"] = record.id;
  return j;
}

nlohmann::ordered_json to_json(const Metadata & metadata)
{
  Json j = Json::object();
  for (const auto & [key, value] : metadata) {
    j[key] = value;
  }
  return j;
}

nlohmann::ordered_json to_json(const DecodeResult & result)
{
  Json traces = Json::array();
  for (const auto & record : result.traces) {
    traces.push_back(to_json(record));
  }
  Json j = Json::object();
  j["metadata"] = to_json(result.metadata);
  j["traces"] = std::move(traces);
  return j;
}

}  // namespace codetrace
