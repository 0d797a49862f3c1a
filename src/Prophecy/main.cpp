// ======================================================================
// Prophecy Field
// Layers of floating billboards over a starfield. Each panel cuts its
// image out of a drifting, blue-tinted ocean texture and bobs at a fixed
// 30 Hz animation rate, whatever the display refresh rate.
//
// Usage: prophecy_field [assetRoot]
// ======================================================================

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "ImageLibrary.hpp"
#include "LayoutEngine.hpp"
#include "PanelRenderer.hpp"
#include "ProphecyField.hpp"
#include "SceneConfig.hpp"
#include "Starfield.hpp"

#include <exception>
#include <iostream>
#include <sstream>

// =====================================================
// Callback: adjust viewport on window resize
// =====================================================
void framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    glViewport(0, 0, width, height);
}

static int run(GLFWwindow* window, const SceneConfig& config) {
    ImageLibrary images(config.assetRoot);
    LayoutEngine layout(images);
    ProphecyField field(layout.buildField(config.layers));
    std::cout << "Built " << field.getLayers().size() << " layers, "
        << field.panelCount() << " panels, " << images.cachedCount() << " images" << std::endl;

    PanelRenderer panels;
    Starfield stars(STAR_COUNT, STAR_RADIUS, STAR_DEPTH, STAR_SIZE_FACTOR);

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_PROGRAM_POINT_SIZE);

    glm::mat4 view = glm::lookAt(CAMERA_POSITION, glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));

    float lastTime = (float)glfwGetTime();
    float fpsTimer = 0.0f;
    int fpsFrames = 0;

    while (!glfwWindowShouldClose(window)) {
        float currentTime = (float)glfwGetTime();
        float dt = currentTime - lastTime;
        lastTime = currentTime;

        field.onFrame(dt);

        int fbWidth, fbHeight;
        glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
        if (fbWidth > 0 && fbHeight > 0) {
            glm::mat4 projection = glm::perspective(glm::radians(CAMERA_FOV),
                (float)fbWidth / (float)fbHeight, CAMERA_NEAR, CAMERA_FAR);

            glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            stars.render(view, projection, currentTime);
            panels.render(field, view, projection);
        }

        // Update window title with frame rate once per second.
        fpsTimer += dt;
        fpsFrames++;
        if (fpsTimer >= 1.0f) {
            std::ostringstream oss;
            oss << WINDOW_TITLE << " - " << fpsFrames << " fps";
            glfwSetWindowTitle(window, oss.str().c_str());
            fpsTimer = 0.0f;
            fpsFrames = 0;
        }

        glfwSwapBuffers(window);
        glfwPollEvents();
    }
    return 0;
}

int main(int argc, char* argv[]) {
    SceneConfig config;
    try {
        config = configFromArgs(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return -1;
    }
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 4);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    GLFWwindow* window = glfwCreateWindow(WINDOW_WIDTH, WINDOW_HEIGHT, WINDOW_TITLE, nullptr, nullptr);
    if (!window) {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return -1;
    }
    glfwMakeContextCurrent(window);
    glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }
    glEnable(GL_MULTISAMPLE);
    std::cout << "OpenGL " << glGetString(GL_VERSION) << std::endl;

    int status = 0;
    try {
        status = run(window, config);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return status;
}
