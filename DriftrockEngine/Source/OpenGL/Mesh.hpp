#ifndef MESH_HPP
#define MESH_HPP
#include <vector>
#include "OpenGLIncludes.hpp"

enum class MeshPrimitive {
    TRIANGLES,
    LINE_LOOP
};

class Mesh {
public:
    // Constructor: provide vertices (x, y, z), indices, and RGB color
    Mesh(const std::vector<float>& verts,
         const std::vector<unsigned int>& inds,
         const float color[3],
         MeshPrimitive primitive = MeshPrimitive::TRIANGLES);

    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    // Render the mesh
    void render() const;

    // Update vertices dynamically (expects x, y, z for each vertex)
    void updateVertices(const std::vector<float>& newVertices);

    // Access color (RenderSystem will set shader uniform)
    const float* getColor() const { return meshColor; }

private:
    std::vector<float> vertices;
    std::vector<unsigned int> indices;
    float meshColor[3];        // RGB
    MeshPrimitive primitive;

    unsigned int VAO = 0;
    unsigned int VBO = 0;
    unsigned int EBO = 0;

    void initBuffers();
    GLenum glPrimitive() const;
};

#endif // MESH_HPP
