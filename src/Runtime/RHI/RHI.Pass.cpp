module;
#include <algorithm>

#include <glm/glm.hpp>

module RHI:Pass.Impl;
import :Pass;

namespace RHI
{
    bool IsResolved(const PassDescriptor& descriptor)
    {
        const bool colorsResolved = std::ranges::all_of(descriptor.ColorAttachments,
            [](const ColorAttachmentDescriptor& color) { return IsResolved(color.Attachment); });

        if (!colorsResolved)
            return false;

        if (descriptor.DepthStencilAttachment)
            return IsResolved(descriptor.DepthStencilAttachment->Attachment);

        return true;
    }
}
