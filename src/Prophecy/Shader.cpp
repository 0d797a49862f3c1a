#include "Shader.hpp"

#include <glm/gtc/type_ptr.hpp>

#include <iostream>
#include <stdexcept>

static void checkCompileErrors(GLuint object, const std::string& type) {
    GLint success = 0;
    char infoLog[1024];
    if (type != "PROGRAM") {
        glGetShaderiv(object, GL_COMPILE_STATUS, &success);
        if (!success) {
            glGetShaderInfoLog(object, 1024, nullptr, infoLog);
            std::cerr << "ERROR::SHADER_COMPILATION_ERROR (" << type << "):\n"
                << infoLog << "\n";
            throw std::runtime_error("Shader: " + type + " shader failed to compile");
        }
    }
    else {
        glGetProgramiv(object, GL_LINK_STATUS, &success);
        if (!success) {
            glGetProgramInfoLog(object, 1024, nullptr, infoLog);
            std::cerr << "ERROR::PROGRAM_LINKING_ERROR (" << type << "):\n"
                << infoLog << "\n";
            throw std::runtime_error("Shader: program failed to link");
        }
    }
}

static GLuint compileStage(GLenum stage, const char* source, const std::string& type) {
    GLuint shader = glCreateShader(stage);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);
    try {
        checkCompileErrors(shader, type);
    }
    catch (...) {
        glDeleteShader(shader);
        throw;
    }
    return shader;
}

Shader::Shader(const char* vertexSrc, const char* fragmentSrc) {
    GLuint vertex = compileStage(GL_VERTEX_SHADER, vertexSrc, "VERTEX");
    GLuint fragment = 0;
    try {
        fragment = compileStage(GL_FRAGMENT_SHADER, fragmentSrc, "FRAGMENT");
    }
    catch (...) {
        glDeleteShader(vertex);
        throw;
    }

    ID = glCreateProgram();
    glAttachShader(ID, vertex);
    glAttachShader(ID, fragment);
    glLinkProgram(ID);

    // Delete shaders after linking
    glDeleteShader(vertex);
    glDeleteShader(fragment);

    try {
        checkCompileErrors(ID, "PROGRAM");
    }
    catch (...) {
        glDeleteProgram(ID);
        throw;
    }
}

Shader::~Shader() {
    glDeleteProgram(ID);
}

void Shader::setMat4(const std::string& name, const glm::mat4& mat) const {
    glUniformMatrix4fv(glGetUniformLocation(ID, name.c_str()), 1, GL_FALSE, glm::value_ptr(mat));
}

void Shader::setVec2(const std::string& name, const glm::vec2& vec) const {
    glUniform2fv(glGetUniformLocation(ID, name.c_str()), 1, glm::value_ptr(vec));
}

void Shader::setFloat(const std::string& name, float value) const {
    glUniform1f(glGetUniformLocation(ID, name.c_str()), value);
}

void Shader::setInt(const std::string& name, int value) const {
    glUniform1i(glGetUniformLocation(ID, name.c_str()), value);
}
