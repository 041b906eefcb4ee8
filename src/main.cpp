#include "app/App.h"

int main(int argc, char* argv[]) {
    taggraph::App app;

    if (!app.init(argc, argv)) {
        return 2;
    }

    int rc = app.run();
    app.shutdown();

    return rc;
}
