#include "gaze/mqtt.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <mosquitto.h>

namespace gaze {

struct MqttService::Impl {
    Impl(AppConfig cfg, Processor proc, StatusBuilder status)
        : config(std::move(cfg)), processor(std::move(proc)), status_builder(std::move(status)) {
        if (!processor) {
            throw std::invalid_argument("MQTT processor callback must not be empty");
        }
        mosquitto_lib_init();
        const char* client_id = nullptr;
        if (!config.mqtt.client_id.empty()) {
            client_id = config.mqtt.client_id.c_str();
        }

        client.reset(mosquitto_new(client_id, true, this));
        if (!client) {
            mosquitto_lib_cleanup();
            throw std::runtime_error("Failed to create MQTT client");
        }

        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_disconnect_callback_set(client.get(), &Impl::onDisconnect);
        mosquitto_message_callback_set(client.get(), &Impl::onMessage);
        mosquitto_reconnect_delay_set(client.get(), 1, 8, true);

        if (!config.mqtt.username.empty()) {
            const char* username = config.mqtt.username.c_str();
            const char* password = config.mqtt.password.empty() ? nullptr : config.mqtt.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), username, password);
            if (rc != MOSQ_ERR_SUCCESS) {
                client.reset();
                mosquitto_lib_cleanup();
                throw std::runtime_error(std::string("Failed to set MQTT credentials: ") + mosquitto_strerror(rc));
            }
        } else if (!config.mqtt.password.empty()) {
            client.reset();
            mosquitto_lib_cleanup();
            throw std::runtime_error("MQTT password provided without username");
        }
    }

    ~Impl()
    {
        stop();
        client.reset();
        mosquitto_lib_cleanup();
    }

    void run()
    {
        const std::string& server = config.mqtt.server;
        if (server.empty()) {
            throw std::runtime_error("MQTT server address is empty");
        }
        int port = config.mqtt.port > 0 ? config.mqtt.port : 1883;
        int keep_alive = 60;
        int rc = mosquitto_connect(client.get(), server.c_str(), port, keep_alive);
        if (rc != MOSQ_ERR_SUCCESS) {
            throw std::runtime_error(std::string("Failed to connect to MQTT broker: ") + mosquitto_strerror(rc));
        }
        std::cout << "[MQTT] Connecting to " << server << ":" << port << std::endl;

        const int heartbeat_s = config.mqtt.heartbeat_time > 0 ? config.mqtt.heartbeat_time : 10;
        heartbeat_thread = std::thread([this, heartbeat_s]() {
            while (!stop_requested.load()) {
                try {
                    publishJson(buildHeartbeat(), config.mqtt.heartbeat_topic);
                } catch (const std::exception& ex) {
                    std::cerr << "[MQTT] Heartbeat send failed: " << ex.what() << std::endl;
                }
                std::unique_lock<std::mutex> lock(wait_mutex);
                wait_cv.wait_for(lock, std::chrono::seconds(heartbeat_s),
                                 [this] { return stop_requested.load(); });
            }
        });

        while (!stop_requested.load()) {
            rc = mosquitto_loop(client.get(), 1000, 1);
            if (stop_requested.load()) {
                break;
            }
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] Loop warning: " << mosquitto_strerror(rc) << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
                mosquitto_reconnect(client.get());
            }
        }
    }

    void stop()
    {
        if (!stop_requested.exchange(true) && client) {
            if (is_connected.load()) {
                publishStatus("offline");
            }
            mosquitto_disconnect(client.get());
        }
        {
            std::lock_guard<std::mutex> lock(wait_mutex);
        }
        wait_cv.notify_all();
        if (heartbeat_thread.joinable()) {
            heartbeat_thread.join();
        }
    }

    Json buildHeartbeat()
    {
        Json heartbeat = status_builder ? status_builder() : Json::object();
        if (!heartbeat.is_object()) {
            heartbeat = Json::object();
        }
        auto ts = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
        heartbeat["type"] = "heartbeat";
        heartbeat["timestamp"] = static_cast<std::int64_t>(ts);
        heartbeat["version"] = config.version;
        heartbeat["service_name"] = config.service.name;
        heartbeat["client_id"] = config.mqtt.client_id;
        return heartbeat;
    }

    bool publishJson(const Json& value, const std::string& topic)
    {
        if (topic.empty()) {
            std::cerr << "[MQTT] Publish skipped: empty topic" << std::endl;
            return false;
        }
        std::lock_guard<std::mutex> lock(publish_mutex);
        std::string payload = value.dump();
        int rc = mosquitto_publish(client.get(), nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), 1, false);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to publish on " << topic << ": " << mosquitto_strerror(rc) << std::endl;
            return false;
        }
        return true;
    }

    void publishStatus(const std::string& state)
    {
        Json payload = Json::object();
        payload["type"] = "service_status";
        payload["state"] = state;
        payload["service_name"] = config.service.name;
        payload["client_id"] = config.mqtt.client_id;
        publishJson(payload, config.mqtt.heartbeat_topic);
    }

    void publishError(const std::string& error)
    {
        Json payload = Json::object();
        payload["type"] = "control_error";
        payload["service_name"] = config.service.name;
        payload["client_id"] = config.mqtt.client_id;
        payload["error"] = error;
        publishJson(payload, config.mqtt.telemetry_topic);
    }

    void handleMessage(const mosquitto_message* message)
    {
        if (!message || !message->payload || message->payloadlen <= 0) {
            return;
        }
        std::string payload(static_cast<const char*>(message->payload),
                            static_cast<std::size_t>(message->payloadlen));
        try {
            processor(Json::parse(payload));
        } catch (const std::exception& ex) {
            std::cerr << "[MQTT] Control message rejected: " << ex.what() << std::endl;
            publishError(ex.what());
        }
    }

    static void onConnect(struct mosquitto* mosq, void* userdata, int rc)
    {
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc == 0) {
            self->is_connected.store(true);
            self->publishStatus("online");
            if (!self->config.mqtt.control_topic.empty()) {
                mosquitto_subscribe(mosq, nullptr, self->config.mqtt.control_topic.c_str(), 1);
            }
            std::cout << "[MQTT] Connected, listening on " << self->config.mqtt.control_topic << std::endl;
        } else {
            std::cerr << "[MQTT] Connect failed: " << mosquitto_connack_string(rc) << std::endl;
        }
    }

    static void onDisconnect(struct mosquitto* mosq, void* userdata, int rc)
    {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        self->is_connected.store(false);
        if (rc != 0) {
            std::cerr << "[MQTT] Unexpected disconnect: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    static void onMessage(struct mosquitto* mosq, void* userdata, const mosquitto_message* message)
    {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        self->handleMessage(message);
    }

    AppConfig config;
    Processor processor;
    StatusBuilder status_builder;
    std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client{nullptr, mosquitto_destroy};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> is_connected{false};
    std::mutex publish_mutex;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;
    std::thread heartbeat_thread;
};

MqttService::MqttService(AppConfig config, Processor processor, StatusBuilder status_builder)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(processor), std::move(status_builder))) {}

MqttService::~MqttService() = default;

void MqttService::run()
{
    impl_->run();
}

void MqttService::stop()
{
    impl_->stop();
}

bool MqttService::publish(const Json& value, const std::string& topic)
{
    return impl_->publishJson(value, topic);
}

bool MqttService::connected() const
{
    return impl_->is_connected.load();
}

bool MqttService::stopped() const
{
    return impl_->stop_requested.load();
}

MqttMotion::MqttMotion(MqttService& service, std::string topic, CameraModel camera)
    : service_(service), topic_(std::move(topic)), camera_(camera) {}

void MqttMotion::send(const Json& payload)
{
    if (service_.stopped()) {
        throw MotionError("MQTT service stopped", true);
    }
    if (!service_.connected()) {
        throw MotionError("MQTT broker not connected");
    }
    if (!service_.publish(payload, topic_)) {
        throw MotionError("Failed to publish motion request on " + topic_);
    }
}

HeadPose MqttMotion::look_at_image(double u, double v, double duration_s, bool perform_movement)
{
    HeadPose target = poseForImagePoint(pose_, u, v, camera_);
    if (perform_movement) {
        send(lookAtImagePayload(u, v, duration_s, target));
        pose_ = target;
    }
    return target;
}

HeadPose MqttMotion::look_at_world(double x, double y, double z, double duration_s)
{
    HeadPose target = poseForWorldPoint(x, y, z);
    send(lookAtWorldPayload(x, y, z, duration_s, target));
    pose_ = target;
    return target;
}

void MqttMotion::send_gaze(const GazeCommand& command)
{
    send(gazePayload(command));
    pose_.pan_deg = command.pan_deg;
    pose_.tilt_deg = command.tilt_deg;
}

}  // namespace gaze
