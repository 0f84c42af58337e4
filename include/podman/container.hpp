#pragma once

#include <string>
#include <utility>

namespace podman {

// Client-side record of a container on the service.
// Owned by whoever issued the request; errors only refer to it.
class container {
public:
    container(std::string id, std::string name, std::string image, std::string status = "created")
        : _id(std::move(id))
        , _name(std::move(name))
        , _image(std::move(image))
        , _status(std::move(status)) {}

    auto id() const -> const std::string& {
        return _id;
    }

    auto short_id() const -> std::string {
        return _id.substr(0, 12);
    }

    auto name() const -> const std::string& {
        return _name;
    }

    auto image() const -> const std::string& {
        return _image;
    }

    auto status() const -> const std::string& {
        return _status;
    }

    // Updated by the inspect/wait calls of the container API.
    auto set_status(std::string status) -> void {
        _status = std::move(status);
    }

private:
    std::string _id;
    std::string _name;
    std::string _image;
    std::string _status;
};

} // namespace podman
