/*
 * Flow Node Main Entry Point
 *
 * Starts a standalone node serving the flow service over Arrow Flight:
 * - Sets up and runs flows requested by other nodes (setup_flow action, RunSyncFlow exchange)
 * - Accepts inbound data streams for the flows it runs
 * - Pushes outbound data streams to the other nodes of a flow
 *
 * Usage:
 *   ./duckflow_node [host] [port] [node_id] [temp_dir]
 *
 * Arguments:
 *   host       - Host address to bind to (default: 0.0.0.0)
 *   port       - Port to listen on (default: 8816)
 *   node_id    - Numeric ID of this node, must not be 0 (default: 1)
 *   temp_dir   - Directory for spilled processor state (default: none, spilling disabled)
 *
 * Examples:
 *   ./duckflow_node                                 # Start on 0.0.0.0:8816 as node 1
 *   ./duckflow_node 0.0.0.0 8817 2 /tmp/duckflow   # Start on port 8817 as node 2 with temp storage
 */

#include <csignal>
#include <iostream>
#include <memory>

#include "server/flow_node.hpp"

using namespace duckflow;

namespace {
std::unique_ptr<FlowNode> g_node;

void SignalHandler(int signal) {
	std::cout << "Received signal " << signal << ", shutting down node..." << std::endl;
	if (g_node) {
		g_node->Shutdown();
	}
	exit(0);
}
} // namespace

int main(int argc, char *argv[]) {
	FlowNodeOptions options;
	options.port = 8816;

	if (argc > 1) {
		options.host = argv[1];
	}
	if (argc > 2) {
		options.port = std::stoi(argv[2]);
	}
	if (argc > 3) {
		options.node_id = std::stoi(argv[3]);
	}
	if (argc > 4) {
		options.temp_dir = argv[4];
	}

	std::cout << "Starting Flow Node" << std::endl;
	std::cout << "Node ID: " << options.node_id << std::endl;
	std::cout << "Host: " << options.host << std::endl;
	std::cout << "Port: " << options.port << std::endl;
	if (!options.temp_dir.empty()) {
		std::cout << "Temp storage: " << options.temp_dir << std::endl;
	}

	// Setup signal handlers.
	signal(SIGINT, SignalHandler);
	signal(SIGTERM, SignalHandler);

	try {
		g_node = std::make_unique<FlowNode>(options);

		auto status = g_node->Start();
		if (!status.ok()) {
			std::cerr << "Failed to start node: " << status.ToString() << std::endl;
			return 1;
		}

		std::cout << "Flow node started successfully!" << std::endl;
		std::cout << "Location: " << g_node->GetLocation() << std::endl;
		std::cout << "Press Ctrl+C to stop" << std::endl;

		auto serve_status = g_node->Serve();
		if (!serve_status.ok()) {
			std::cerr << "Node error: " << serve_status.ToString() << std::endl;
			return 1;
		}
	} catch (const std::exception &ex) {
		std::cerr << "Fatal error: " << ex.what() << std::endl;
		return 1;
	}

	return 0;
}
