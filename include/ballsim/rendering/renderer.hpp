/**
 * @file renderer.hpp
 * @brief Draws the bodies of the registry with SFML
 *
 * The window is WindowWidth x WindowHeight pixels with the world origin at
 * its centre and y pointing up. A body is drawn as a circle of Radius pixels
 * at position * PixelsPerMeter. Fixed bodies use a dimmed fill.
 */

#pragma once

#include <string>
#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "ballsim/core/system_config.hpp"

/**
 * @class Renderer
 * @brief Owns the SFML window and draws one frame at a time
 */
class Renderer {
public:
    Renderer(unsigned int screenWidth, unsigned int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the SFML window
     * @return true if the window is open
     */
    bool init();

    /** Clears the screen to black */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Draws every body in the registry
     * @param registry ECS registry containing the bodies
     * @param config Supplies the world-to-pixel scale
     */
    void renderBodies(const entt::registry& registry, const SystemConfig& config);

    /**
     * @brief Shows FPS, body count and run state in the window title
     */
    void renderStatus(float fps, std::size_t bodies, const std::string& state);

    /**
     * @brief Maps a world position to window pixel coordinates
     */
    sf::Vector2f toScreen(double x, double y, const SystemConfig& config) const;

    sf::RenderWindow& getWindow() { return window; }


private:
    sf::RenderWindow window;
    unsigned int screenWidth;
    unsigned int screenHeight;
};
