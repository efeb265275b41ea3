// ==================================================================================
// Example: Scheme Echo
// ==================================================================================
// Serves the page from a custom scheme, echoes POSTed binary bodies back through
// the asynchronously answered io:// scheme and streams counted chunks through
// stream://. Messages sent through window.ipc are answered by evaluating a script
// in the page.
// ==================================================================================

#include <canopy/webview.hpp>

#include <gtk/gtk.h>
#include <glaze/glaze.hpp>

#include <chrono>
#include <format>
#include <thread>
#include <optional>
#include <iostream>

static constexpr auto html = R"html(
<!DOCTYPE html>
<html>
<head>
    <meta charset="UTF-8">
    <title>Scheme Echo</title>
    <style>
        body { font-family: monospace; padding: 20px; background: #1a1a2e; color: #eee; }
        #log { background: #16213e; padding: 10px; height: 300px; overflow-y: auto; border-radius: 4px; }
    </style>
</head>
<body>
    <h1>Scheme Echo</h1>
    <input id="text" value="hello">
    <button onclick="echo()">Echo</button>
    <button onclick="stream()">Stream</button>
    <button onclick="ping()">Ping</button>
    <div id="log"></div>

    <script>
        function log(msg) {
            const el = document.getElementById('log');
            el.innerHTML += `<div>${msg}</div>`;
        }

        async function echo() {
            const body = new Uint8Array(256).map((_, i) => i);
            const response = await fetch('io://localhost/echo', { method: 'POST', body });
            const echoed = new Uint8Array(await response.arrayBuffer());
            const intact = echoed.length === body.length && echoed.every((value, i) => value === body[i]);
            log(`echo (${response.status}): ${echoed.length} bytes, ${intact ? 'intact' : 'corrupted'}`);
        }

        async function stream() {
            const response = await fetch('stream://localhost/count');
            const reader = response.body.getReader();
            let chunks = 0;

            while (true) {
                const { done } = await reader.read();
                if (done) break;
                chunks++;
            }

            log(`stream: ${chunks} chunks`);
        }

        function ping() {
            window.ipc.postMessage(document.getElementById('text').value);
        }
    </script>
</body>
</html>
)html";

static std::optional<canopy::webview> view;

static void activate(GtkApplication *app, gpointer)
{
    auto *const window = gtk_application_window_new(app);

    gtk_window_set_title(GTK_WINDOW(window), "Scheme Echo");
    gtk_window_set_default_size(GTK_WINDOW(window), 800, 600);

    auto serve = [](const canopy::scheme::request &) -> canopy::scheme::response
    {
        return {.data = canopy::stash::view_str(html), .mime = "text/html"};
    };

    auto echo = [](canopy::scheme::request req, canopy::scheme::executor exec)
    {
        if (req.method() != "POST")
        {
            exec.reject(canopy::scheme::error::invalid);
            return;
        }

        // Answered from another thread, the executor hands the response to the owning thread
        std::thread{[req = std::move(req), exec = std::move(exec)]
                    {
                        exec.resolve({
                            .data    = req.content(),
                            .mime    = "application/octet-stream",
                            .headers = {{"Access-Control-Allow-Origin", "*"}},
                        });
                    }}
            .detach();
    };

    auto stream = [](canopy::scheme::request, canopy::scheme::executor exec)
    {
        std::thread{[exec = std::move(exec)]
                    {
                        exec.start({.mime = "text/plain", .headers = {{"Access-Control-Allow-Origin", "*"}}});

                        for (auto i = 0; i < 50 && exec.valid(); ++i)
                        {
                            exec.write(canopy::stash::from_str(std::format("chunk {}\n", i)));
                            std::this_thread::sleep_for(std::chrono::milliseconds{20});
                        }

                        exec.finish();
                    }}
            .detach();
    };

    auto created = canopy::webview::create(window, {
                                                       .url       = "app://localhost/index.html",
                                                       .devtools  = true,
                                                       .protocols =
                                                           {
                                                               {.scheme = "app", .handler = serve},
                                                               {.scheme = "io", .handler = echo},
                                                               {.scheme = "stream", .handler = stream},
                                                           },
                                                       .message_handler =
                                                           [](std::string message)
                                                       {
                                                           auto reply = std::format("log('pong: ' + {})", glz::write_json(message).value_or("\"\""));

                                                           if (auto ok = view->execute(reply); !ok)
                                                           {
                                                               std::cerr << "could not reply: " << ok.error().what() << std::endl;
                                                           }
                                                       },
                                                   });

    if (!created)
    {
        std::cerr << "could not create webview: " << created.error().what() << std::endl;
        return;
    }

    view.emplace(std::move(created.value()));
    gtk_window_present(GTK_WINDOW(window));
}

int main(int argc, char **argv)
{
    auto *const app = gtk_application_new("dev.canopy.scheme-echo", G_APPLICATION_DEFAULT_FLAGS);

    g_signal_connect(app, "activate", G_CALLBACK(activate), nullptr);

    const auto status = g_application_run(G_APPLICATION(app), argc, argv);

    view.reset();
    g_object_unref(app);

    return status;
}
