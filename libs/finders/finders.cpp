/**
 * @file finders.cpp
 * @brief Production finder order
 */

#include "panicscan/invocation_finder.hpp"

namespace panicscan::callgraph {

std::vector<std::unique_ptr<InvocationFinder>> default_invocation_finders()
{
    std::vector<std::unique_ptr<InvocationFinder>> finders;
    finders.push_back(std::make_unique<DirectCallFinder>());
    finders.push_back(std::make_unique<JumpFinder>());
    finders.push_back(std::make_unique<VTableFinder>());
    finders.push_back(std::make_unique<ProcedureReferenceFinder>());
    return finders;
}

}  // namespace panicscan::callgraph
