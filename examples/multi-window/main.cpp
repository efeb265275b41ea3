// ==================================================================================
// Example: Multi Window
// ==================================================================================
// Two windows, each hosting its own webview. Messages posted in one window are
// forwarded to the other. The second webview lives in a GtkFixed next to a native
// button and is resized whenever the button is clicked. Files dropped on either
// view are listed instead of being opened.
// ==================================================================================

#include <canopy/webview.hpp>

#include <gtk/gtk.h>
#include <glaze/glaze.hpp>

#include <array>
#include <format>
#include <optional>
#include <iostream>

static constexpr auto html = R"html(
<!DOCTYPE html>
<html>
<head>
    <meta charset="UTF-8">
    <style>
        body { font-family: monospace; padding: 20px; background: #1a1a2e; color: #eee; }
    </style>
</head>
<body>
    <h1 id="title"></h1>
    <input id="text" value="hello"> <button onclick="window.ipc.postMessage(document.getElementById('text').value)">Send</button>
    <div id="log"></div>
    <script>
        function log(msg) {
            document.getElementById('log').innerHTML += `<div>${msg}</div>`;
        }
    </script>
</body>
</html>
)html";

static std::array<std::optional<canopy::webview>, 2> views;

static std::string quote(const std::string &text)
{
    return glz::write_json(text).value_or("\"\"");
}

static void forward(std::size_t from, const std::string &message)
{
    auto &target = views[1 - from];

    if (!target)
    {
        return;
    }

    if (auto ok = target->execute(std::format("log('window {}: ' + {})", from + 1, quote(message))); !ok)
    {
        std::cerr << "could not forward message: " << ok.error().what() << std::endl;
    }
}

static canopy::options make(std::size_t index)
{
    return {
        .html     = html,
        .scripts  = {std::format("addEventListener('DOMContentLoaded', () => document.getElementById('title').textContent = 'Window {}');",
                                 index + 1)},
        .message_handler = [index](std::string message) { forward(index, message); },
        .drop_handler =
            [index](const canopy::drop_event &event)
        {
            if (event.kind != canopy::drop_kind::dropped)
            {
                return true;
            }

            for (const auto &path : event.paths)
            {
                if (auto ok = views[index]->execute(std::format("log('dropped ' + {})", quote(path.string()))); !ok)
                {
                    std::cerr << "could not list drop: " << ok.error().what() << std::endl;
                }
            }

            return true;
        },
    };
}

static void grow(GtkButton *, gpointer)
{
    static int width = 400;

    width = width >= 700 ? 400 : width + 100;

    if (auto ok = views[1]->resize({.x = 0, .y = 40, .width = width, .height = 400}); !ok)
    {
        std::cerr << "could not resize: " << ok.error().what() << std::endl;
    }
}

static void activate(GtkApplication *app, gpointer)
{
    auto *const first = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(first), "Window 1");
    gtk_window_set_default_size(GTK_WINDOW(first), 600, 400);

    auto *const second = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(second), "Window 2");
    gtk_window_set_default_size(GTK_WINDOW(second), 800, 500);

    auto *const fixed  = gtk_fixed_new();
    auto *const button = gtk_button_new_with_label("Resize");

    gtk_fixed_put(GTK_FIXED(fixed), button, 0, 0);
    gtk_window_set_child(GTK_WINDOW(second), fixed);

    g_signal_connect(button, "clicked", G_CALLBACK(grow), nullptr);

    auto bottom   = make(1);
    bottom.bounds = canopy::rect{.x = 0, .y = 40, .width = 400, .height = 400};

    auto top    = canopy::webview::create(first, make(0));
    auto nested = canopy::webview::create(fixed, std::move(bottom));

    if (!top || !nested)
    {
        std::cerr << "could not create webviews: " << (top ? nested.error() : top.error()).what() << std::endl;
        return;
    }

    views[0].emplace(std::move(top.value()));
    views[1].emplace(std::move(nested.value()));

    gtk_window_present(GTK_WINDOW(first));
    gtk_window_present(GTK_WINDOW(second));
}

int main(int argc, char **argv)
{
    auto *const app = gtk_application_new("dev.canopy.multi-window", G_APPLICATION_DEFAULT_FLAGS);

    g_signal_connect(app, "activate", G_CALLBACK(activate), nullptr);

    const auto status = g_application_run(G_APPLICATION(app), argc, argv);

    views = {};
    g_object_unref(app);

    return status;
}
