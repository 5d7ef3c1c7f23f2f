#include "Mesh.hpp"
#include "Utils/Debug/Debug.hpp"

Mesh::Mesh(const std::vector<float>& verts,
           const std::vector<unsigned int>& inds,
           const float color[3],
           MeshPrimitive primitive)
    : vertices(verts), indices(inds), primitive(primitive)
{
    meshColor[0] = color[0];
    meshColor[1] = color[1];
    meshColor[2] = color[2];

    initBuffers();
}

Mesh::~Mesh() {
    if (VAO) glDeleteVertexArrays(1, &VAO);
    if (VBO) glDeleteBuffers(1, &VBO);
    if (EBO) glDeleteBuffers(1, &EBO);
}

GLenum Mesh::glPrimitive() const {
    return primitive == MeshPrimitive::LINE_LOOP ? GL_LINE_LOOP : GL_TRIANGLES;
}

void Mesh::initBuffers() {
    // Vertex data must be multiples of 3: x, y, z
    if (vertices.size() % 3 != 0) {
        Debug::Error("RenderSystem") << "Vertex data must have 3 components per vertex, got " << vertices.size();
        return;
    }

    glGenVertexArrays(1, &VAO);
    glBindVertexArray(VAO);

    glGenBuffers(1, &VBO);
    glBindBuffer(GL_ARRAY_BUFFER, VBO);
    glBufferData(GL_ARRAY_BUFFER,
                 vertices.size() * sizeof(float),
                 vertices.data(),
                 GL_DYNAMIC_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE,
                          3 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);

    if (!indices.empty()) {
        glGenBuffers(1, &EBO);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER,
                     indices.size() * sizeof(unsigned int),
                     indices.data(),
                     GL_STATIC_DRAW);
    }

    glBindVertexArray(0);
}

void Mesh::render() const {
    if (VAO == 0) {
        Debug::Error("RenderSystem") << "VAO is 0, mesh not initialized";
        return;
    }

    glBindVertexArray(VAO);

    if (!indices.empty()) {
        glDrawElements(glPrimitive(),
                       static_cast<GLsizei>(indices.size()),
                       GL_UNSIGNED_INT,
                       0);
    } else {
        GLsizei vertCount = static_cast<GLsizei>(vertices.size() / 3);
        glDrawArrays(glPrimitive(), 0, vertCount);
    }

    GLenum err = glGetError();
    if (err != GL_NO_ERROR) {
        Debug::Error("RenderSystem") << "GL error after draw: " << err;
    }

    glBindVertexArray(0);
}

void Mesh::updateVertices(const std::vector<float>& newVertices) {
    if (newVertices.size() % 3 != 0) {
        Debug::Error("RenderSystem") << "New vertex data must have 3 components per vertex";
        return;
    }

    if (VBO == 0) {
        Debug::Error("RenderSystem") << "VBO not initialized";
        return;
    }

    glBindBuffer(GL_ARRAY_BUFFER, VBO);

    // Compare before replacing the cached vertices
    size_t newSize = newVertices.size() * sizeof(float);
    size_t oldSize = vertices.size() * sizeof(float);

    if (newSize > oldSize) {
        glBufferData(GL_ARRAY_BUFFER, newSize, newVertices.data(), GL_DYNAMIC_DRAW);
    } else {
        glBufferSubData(GL_ARRAY_BUFFER, 0, newSize, newVertices.data());
    }

    vertices = newVertices;
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}
