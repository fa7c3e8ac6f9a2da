module;

#include <concepts>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // -------------------------------------------------------------------------
    // ResourcePool - generational storage addressed by StrongHandle
    // -------------------------------------------------------------------------
    // Readers resolve handles every time they need the resource; a handle to a
    // removed or replaced-slot resource stops resolving immediately. Memory of
    // removed resources is reclaimed FramesInFlight frames later so pointers
    // handed out during the current frame stay valid until it is retired.
    // -------------------------------------------------------------------------
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;
        ResourcePool(ResourcePool&&) noexcept = default;
        ResourcePool& operator=(ResourcePool&&) noexcept = default;

        void Initialize(const uint32_t framesInFlight)
        {
            m_FramesInFlight = framesInFlight;
        }

        Handle Add(std::unique_ptr<T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        template<typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // Swap the resource behind a live handle (e.g. a rebuilt pipeline).
        // The previous object is retired like a removed one.
        [[nodiscard]] Result Replace(Handle handle, std::unique_ptr<T> resource, uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size())
                return Err(ErrorCode::ResourceNotFound);

            Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation)
                return Err(ErrorCode::ResourceNotFound);

            m_Retired.push_back({
                .Data = std::move(slot.Data),
                .KillFrameNumber = currentFrameNumber
            });
            slot.Data = std::move(resource);
            return Ok();
        }

        void Remove(Handle handle, uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size()) return;

            Slot& slot = m_Slots[handle.Index];
            if (slot.IsActive && slot.Generation == handle.Generation)
            {
                slot.IsActive = false;
                --m_ActiveCount;

                m_PendingKillList.push_back({
                    .SlotIndex = handle.Index,
                    .Generation = handle.Generation,
                    .KillFrameNumber = currentFrameNumber
                });
            }
        }

        void ProcessDeletions(uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);

            std::erase_if(m_PendingKillList, [&](const PendingKill& item)
            {
                if (currentFrameNumber <= item.KillFrameNumber + m_FramesInFlight)
                    return false;

                if (item.SlotIndex < m_Slots.size())
                {
                    Slot& slot = m_Slots[item.SlotIndex];
                    if (!slot.IsActive && slot.Generation == item.Generation)
                    {
                        slot.Data.reset();
                        m_FreeIndices.push_back(item.SlotIndex);
                    }
                }
                return true;
            });

            std::erase_if(m_Retired, [&](const RetiredObject& item)
            {
                return currentFrameNumber > item.KillFrameNumber + m_FramesInFlight;
            });
        }

        [[nodiscard]] Expected<T*> Get(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size())
                return std::unexpected(ErrorCode::ResourceNotFound);

            const Slot& slot = m_Slots[handle.Index];

            if (!slot.IsActive || slot.Generation != handle.Generation)
                return std::unexpected(ErrorCode::ResourceNotFound);

            return slot.Data.get();
        }

        // Returns nullptr instead of an error code.
        [[nodiscard]] T* GetUnchecked(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (handle.Index < m_Slots.size())
            {
                const Slot& slot = m_Slots[handle.Index];
                if (slot.IsActive && slot.Generation == handle.Generation)
                {
                    return slot.Data.get();
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool Contains(Handle handle) const
        {
            return GetUnchecked(handle) != nullptr;
        }

        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_PendingKillList.clear();
            m_Retired.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t Capacity() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Slots.size();
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_ActiveCount;
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrameNumber;
        };

        struct RetiredObject
        {
            std::unique_ptr<T> Data;
            uint64_t KillFrameNumber;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKillList;
        std::vector<RetiredObject> m_Retired;
        size_t m_ActiveCount = 0;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_FramesInFlight = 2;
    };
}
