#ifndef MANIFOLD_ACTIVATION_HPP
#define MANIFOLD_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Manifold::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        SiLU,
        GeLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor GeLU{Type::GeLU}; // https://arxiv.org/pdf/1606.08415
}

#endif //MANIFOLD_ACTIVATION_HPP
