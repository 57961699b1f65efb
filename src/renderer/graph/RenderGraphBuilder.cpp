#include "RenderGraphBuilder.hpp"

namespace ember {

RenderGraphBuilder::RenderGraphBuilder(RenderGraph& g, entt::entity view)
    : ViewScope(g.getWorld(), view), graph(g) {
}

BindGroupId RenderGraphBuilder::newBindGroup(BindGroupDesc desc) {
    requireBuilding("newBindGroup");
    return graph.declareBindGroup(eastl::move(desc));
}

RenderGraphBuilder& RenderGraphBuilder::addNode(const eastl::string& name, RenderDependencies dependencies, NodeFunction function) {
    requireBuilding("addNode");

    RenderNode node;
    node.name = name;
    node.dependencies = eastl::move(dependencies);
    node.view = view;
    node.function = eastl::move(function);
    graph.attachNode(eastl::move(node));

    return *this;
}

DeviceFeatures RenderGraphBuilder::features() const {
    return graph.getDevice().features();
}

const DeviceLimits& RenderGraphBuilder::limits() const {
    return graph.getDevice().limits();
}

void RenderGraphBuilder::requireBuilding(const char* operation) const {
    graph.requirePhase(GraphPhase::Building, operation);
}

} // namespace ember
