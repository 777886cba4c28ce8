// SPDX-License-Identifier: GPL-2.0-or-later
#include <glib.h>
#include "statics.h"

Svgfx::Util::StaticsBin &Svgfx::Util::StaticsBin::get()
{
    static StaticsBin instance;
    return instance;
}

void Svgfx::Util::StaticsBin::destroy()
{
    while (head) {
        auto current = head;
        head = head->next;
        current->destroy();
    }
}

Svgfx::Util::StaticsBin::~StaticsBin()
{
    // destroy() wasn't called close enough to the end of main().
    if (head) {
        g_critical("StaticsBin::destroy() must be called before main() exit");
    }
}
