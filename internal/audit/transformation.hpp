#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "flightrec/v1/audit.pb.h"

namespace flightrec::audit {

/*
  Shape heuristics for describing how a layer changed its data.

    creation         input absent (null)
    deletion         output absent (null)
    type-conversion  scalar kinds differ, e.g. string → number
    structure-change object ↔ array
    modification     same kind, different content
*/
std::string ClassifyTransformation(const google::protobuf::Value& input, const google::protobuf::Value& output);

// Classification plus the top-level field diff for object → object changes.
flightrec::v1::TransformationAnalysis AnalyzeTransformation(const google::protobuf::Value& input, const google::protobuf::Value& output);

} // namespace flightrec::audit
