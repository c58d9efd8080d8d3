#include "ballsim/rendering/renderer.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/core/constants.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Ball Simulator");
    if (!window.isOpen()) {
        std::cerr << "Failed to create a " << screenWidth << "x" << screenHeight << " window\n";
        return false;
    }
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

sf::Vector2f Renderer::toScreen(double x, double y, const SystemConfig& config) const {
    double const px = screenWidth / 2.0 + SimulatorConstants::metersToPixels(x, config.PixelsPerMeter);
    double const py = screenHeight / 2.0 - SimulatorConstants::metersToPixels(y, config.PixelsPerMeter);
    return {static_cast<float>(px), static_cast<float>(py)};
}

void Renderer::renderBodies(const entt::registry &registry, const SystemConfig& config) {
    auto view = registry.view<const Components::Position, const Components::Radius>();
    for (auto entity : view) {
        const auto &pos = view.get<const Components::Position>(entity);
        const auto &radius = view.get<const Components::Radius>(entity);

        sf::Color fillColor = sf::Color::Green;
        if (const auto *col = registry.try_get<Components::Color>(entity)) {
            fillColor = sf::Color(col->r, col->g, col->b);
        }

        const auto *fixed = registry.try_get<Components::Fixed>(entity);
        if (fixed && fixed->value) {
            fillColor = sf::Color(fillColor.r / 3, fillColor.g / 3, fillColor.b / 3);
        }

        float const radiusPixels = std::max(1.0F, static_cast<float>(radius.value));
        sf::CircleShape circle(radiusPixels);
        circle.setOrigin(radiusPixels, radiusPixels);
        circle.setPosition(toScreen(pos.x, pos.y, config));
        circle.setFillColor(fillColor);
        window.draw(circle);
    }
}

void Renderer::renderStatus(float fps, std::size_t bodies, const std::string& state) {
    std::ostringstream title;
    title << "Ball Simulator | " << state
          << " | bodies: " << bodies
          << " | FPS: " << std::fixed << std::setprecision(1) << fps;
    window.setTitle(title.str());
}
