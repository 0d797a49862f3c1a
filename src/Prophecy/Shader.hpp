#pragma once

#include <glad/glad.h>
#include <glm/glm.hpp>

#include <string>

// Compiled and linked GL program. Throws std::runtime_error when compiling or
// linking fails; the info log goes to std::cerr first.
class Shader {
public:
    Shader(const char* vertexSrc, const char* fragmentSrc);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    void use() const { glUseProgram(ID); }
    GLuint id() const { return ID; }

    void setMat4(const std::string& name, const glm::mat4& mat) const;
    void setVec2(const std::string& name, const glm::vec2& vec) const;
    void setFloat(const std::string& name, float value) const;
    void setInt(const std::string& name, int value) const;

private:
    GLuint ID;
};
