#ifndef OPENGL_INCLUDES_HPP
#define OPENGL_INCLUDES_HPP

// GLEW must come before any other GL header
#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#endif // OPENGL_INCLUDES_HPP
