#include "rotation/double_buffer.h"

#include <utility>

namespace drift
{
DoubleBuffer::DoubleBuffer(RenderSurface& a, RenderSurface& b)
    : m_surfaces{&a, &b}
{
    m_slots[0].role = SlotRole::Primary;
    m_slots[1].role = SlotRole::Secondary;
    m_surfaces[0]->SetVisibleImmediate(false);
    m_surfaces[1]->SetVisibleImmediate(false);
}

void DoubleBuffer::AssignHidden(LoadResult result)
{
    const int idx = SecondaryIndex();
    m_slots[idx].current_url = std::move(result.source_url);
    m_surfaces[idx]->SetBitmap(std::move(result.bitmap));
}

void DoubleBuffer::ShowOnPrimary(LoadResult result)
{
    const int idx = m_primary;
    m_slots[idx].current_url = std::move(result.source_url);
    m_slots[idx].visible = true;
    m_surfaces[idx]->SetBitmap(std::move(result.bitmap));
    m_surfaces[idx]->SetVisibleImmediate(true);
}

void DoubleBuffer::FlushLayout()
{
    m_surfaces[0]->FlushLayout();
    m_surfaces[1]->FlushLayout();
}

void DoubleBuffer::BeginCrossfade(std::function<void()> on_end)
{
    const int in = SecondaryIndex();
    const int out = m_primary;
    m_slots[in].visible = true;
    m_slots[out].visible = false;
    m_surfaces[out]->FadeTo(false, nullptr);
    m_surfaces[in]->FadeTo(true, std::move(on_end));
}

void DoubleBuffer::SwapRoles()
{
    m_primary = SecondaryIndex();
    m_slots[m_primary].role = SlotRole::Primary;
    m_slots[1 - m_primary].role = SlotRole::Secondary;
}
} // namespace drift
