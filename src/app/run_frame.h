#pragma once

namespace drift
{
struct AppState;

namespace app
{
// Run one frame of the main loop: pump events, run the rotation engine's
// pending work, draw backdrop + controls, render, and update `st.done`.
void RunFrame(AppState& st);
} // namespace app
} // namespace drift
