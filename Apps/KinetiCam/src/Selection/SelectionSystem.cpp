/*
 *  KinetiCam - Selection System Implementation
 */

#include "SelectionSystem.hpp"
#include <KinetiCam/Core/Logger.h>

#include <algorithm>

namespace KinetiCam
{

SelectionSystem::SelectionSystem(QObject* parent)
    : QObject(parent)
{
    connect(this, &SelectionSystem::selectionChanged, this, [this]() { invalidateSnapshot(); });
}

void SelectionSystem::setMesh(std::vector<EditVertex> vertices, const glm::mat4& worldTransform)
{
    m_vertices = std::move(vertices);
    m_worldTransform = worldTransform;
    invalidateSnapshot();
    KC_LOG_DEBUG("Edit mesh set: {} vertices", m_vertices.size());

    // Old indices point into the previous mesh
    clearSelection();
}

void SelectionSystem::setWorldTransform(const glm::mat4& worldTransform)
{
    m_worldTransform = worldTransform;
    invalidateSnapshot();
}

void SelectionSystem::setEditMode(bool enabled)
{
    if (m_editMode == enabled)
        return;

    m_editMode = enabled;
    KC_LOG_DEBUG("Edit mode {}", enabled ? "on" : "off");
    emit editModeChanged(enabled);
}

bool SelectionSystem::setSelection(const std::vector<uint32_t>& indices)
{
    std::vector<uint32_t> picked;
    picked.reserve(indices.size());
    for (uint32_t index : indices)
    {
        if (index >= vertexCount())
        {
            KC_LOG_WARN("Vertex {} is not on the edit mesh ({} vertices)", index, vertexCount());
            continue;
        }
        picked.push_back(index);
    }
    std::sort(picked.begin(), picked.end());
    picked.erase(std::unique(picked.begin(), picked.end()), picked.end());

    if (picked == m_selected)
        return false;

    m_selected = std::move(picked);
    KC_LOG_DEBUG("Vertex selection: {} of {}", m_selected.size(), vertexCount());
    emit selectionChanged();
    return true;
}

void SelectionSystem::clearSelection()
{
    if (m_selected.empty())
        return;

    m_selected.clear();
    KC_LOG_DEBUG("Vertex selection cleared");
    emit selectionChanged();
}

std::optional<SelectionSnapshot> SelectionSystem::selection() const
{
    if (!m_editMode || m_selected.empty())
        return std::nullopt;

    if (!m_snapshot)
    {
        SelectionSnapshot snapshot;
        snapshot.worldTransform = m_worldTransform;
        snapshot.elements.reserve(m_selected.size());
        for (uint32_t index : m_selected)
        {
            const EditVertex& vertex = m_vertices[index];
            snapshot.elements.push_back(SelectedElement{vertex.position, vertex.normal, index});
        }
        m_snapshot = std::move(snapshot);
    }
    return m_snapshot;
}

} // namespace KinetiCam
