/*
 *  KinetiCam - Selection System
 *  Vertex selection on the edit mesh, exposed to the rig as a selection source
 */

#pragma once

#include <KinetiCam/Rig/HostInterfaces.h>

#include <QObject>

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace KinetiCam
{

/**
 * @brief Vertex of the edit mesh, object space
 */
struct EditVertex
{
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f};
};

/**
 * @brief Edit mesh plus the vertices the user picked on it
 *
 * The rig only sees a selection while edit mode is on. The snapshot handed to
 * the rig is built once per selection and reused until selectionChanged fires.
 */
class SelectionSystem : public QObject, public SelectionSource
{
    Q_OBJECT

public:
    explicit SelectionSystem(QObject* parent = nullptr);
    ~SelectionSystem() override = default;

    // Non-copyable
    SelectionSystem(const SelectionSystem&) = delete;
    SelectionSystem& operator=(const SelectionSystem&) = delete;

    /**
     * @brief Replace the edit mesh; clears the selection
     */
    void setMesh(std::vector<EditVertex> vertices, const glm::mat4& worldTransform = glm::mat4(1.0f));

    uint32_t vertexCount() const { return static_cast<uint32_t>(m_vertices.size()); }

    const glm::mat4& worldTransform() const { return m_worldTransform; }
    void setWorldTransform(const glm::mat4& worldTransform);

    bool editMode() const { return m_editMode; }
    void setEditMode(bool enabled);

    /**
     * @brief Make exactly these vertices the selection
     *
     * Indices outside the mesh are dropped with a warning and duplicates are
     * merged. Emits selectionChanged only when the resulting set differs.
     * @return true if the selection changed
     */
    bool setSelection(const std::vector<uint32_t>& indices);

    void clearSelection();

    // Selected vertex indices, ascending and unique
    const std::vector<uint32_t>& selectedVertices() const { return m_selected; }
    bool isEmpty() const { return m_selected.empty(); }

    // SelectionSource
    bool isEditContext() const override { return m_editMode; }
    std::optional<SelectionSnapshot> selection() const override;

signals:
    void selectionChanged();
    void editModeChanged(bool enabled);

private:
    void invalidateSnapshot() { m_snapshot.reset(); }

    std::vector<EditVertex> m_vertices;
    glm::mat4 m_worldTransform{1.0f};
    std::vector<uint32_t> m_selected;
    bool m_editMode = false;

    // Built lazily from m_selected; empty means stale
    mutable std::optional<SelectionSnapshot> m_snapshot;
};

} // namespace KinetiCam
