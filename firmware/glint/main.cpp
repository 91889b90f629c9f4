// SPDX-License-Identifier: MIT
// Project Glint - Demo Firmware Entry Point
//
// Called by the boot ROM hand-off code after .data/.bss setup, with the
// core already on the 160 MHz PLL.
//
// Execution order:
//   1.  log_init()            - ring buffer mutex for glint_log
//   2.  Glb::take() + split() - one typed handle per pin and UART signal
//   3.  Debug UART            - GPIO16/GPIO7 to UART function, signals 0/7
//                               routed to UART0 TX/RX, UART0 at DEBUG_BAUD
//   4.  LED + button          - outputs for the RGB LED, pull-up input with
//                               falling-edge interrupt on IO8
//   5.  Power-on blink        - McycleDelay busy-wait, before the scheduler
//   6.  Tasks + scheduler     - log drain task and the blink/button task

#include "glint_config.hpp"
#include "hal/glb.hpp"
#include "hal/delay.hpp"
#include "hal/uart.hpp"
#include "log/log.hpp"
#include "bsp/board_pins.hpp"

#include "FreeRTOS.h"
#include "task.h"

#include <optional>
#include <utility>

using namespace glint;

namespace {

struct Board {
    Pin<LED_BLUE_PIN, Output<Floating>>  led_blue;
    Pin<LED_GREEN_PIN, Output<Floating>> led_green;
    Pin<LED_RED_PIN, Output<Floating>>   led_red;
    Pin<BUTTON_PIN, Input<PullUp>>       button;
    McycleDelay                          delay;
};

// Static storage: the blink task keeps a pointer to it for the life of the
// firmware.
std::optional<Board> s_board;

void uart_sink(const char* data, size_t len) {
    uart_write(data, len);
}

void blink_task(void* params) {
    Board& board = *static_cast<Board*>(params);
    uint32_t presses = 0;

    for (;;) {
        board.led_blue.toggle();

        if (board.button.is_pending()) {
            board.button.clear_pending();
            ++presses;
            board.led_green.toggle();
            glint_log("BUTTON", "press %lu", static_cast<unsigned long>(presses));
        }
        vTaskDelay(pdMS_TO_TICKS(250));
    }
}

} // anonymous namespace

extern "C" int main() {
    // -------------------------------------------------------------------------
    // 1. Logger
    // -------------------------------------------------------------------------
    const bool log_ok = log_init();
    configASSERT(log_ok);

    // -------------------------------------------------------------------------
    // 2. Acquire every pin and UART signal exactly once
    // -------------------------------------------------------------------------
    std::optional<Glb> glb = Glb::take();
    configASSERT(glb.has_value());
    Parts p = std::move(*glb).split();

    // -------------------------------------------------------------------------
    // 3. Debug UART: the pin picks the signal, the mux picks the peripheral
    // -------------------------------------------------------------------------
    auto uart_tx = std::move(p.pin<DEBUG_UART_TX_PIN>()).into_uart();
    auto uart_rx = std::move(p.pin<DEBUG_UART_RX_PIN>()).into_uart();
    static_assert(is_uart_pin_for_v<decltype(uart_tx), DEBUG_UART_TX_SIG>, "TX pin not on signal 0");
    static_assert(is_uart_pin_for_v<decltype(uart_rx), DEBUG_UART_RX_SIG>, "RX pin not on signal 7");

    auto tx_route = std::move(p.uart_mux<DEBUG_UART_TX_SIG>()).route_to_uart0_tx();
    auto rx_route = std::move(p.uart_mux<DEBUG_UART_RX_SIG>()).route_to_uart0_rx();
    (void)tx_route;
    (void)rx_route;

    uart_init(UART_CLOCK_HZ, DEBUG_BAUD);
    glint_log("MAIN", "glint demo, core %lu Hz", static_cast<unsigned long>(CORE_CLOCK_HZ));

    // -------------------------------------------------------------------------
    // 4. LED and button
    // -------------------------------------------------------------------------
    auto button = std::move(p.pin<BUTTON_PIN>()).into_pull_up_input();
    button.enable_input_filter();
    button.set_trigger_event(Event::NegativePulse);
    button.set_sampling_synchronous();
    button.clear_pending();
    button.enable_interrupt();

    s_board.emplace(Board{
        std::move(p.pin<LED_BLUE_PIN>()).into_floating_output(),
        std::move(p.pin<LED_GREEN_PIN>()).into_floating_output(),
        std::move(p.pin<LED_RED_PIN>()).into_floating_output(),
        std::move(button),
        McycleDelay(CORE_CLOCK_HZ),
    });
    Board& board = *s_board;
    board.led_green.set_high();  // off (active-low)
    board.led_red.set_high();

    // -------------------------------------------------------------------------
    // 5. Power-on blink (no scheduler yet, so busy-wait)
    // -------------------------------------------------------------------------
    for (int i = 0; i < 6; ++i) {
        board.led_blue.toggle();
        board.delay.delay_milliseconds(100);
    }
    log_drain(uart_sink);

    // -------------------------------------------------------------------------
    // 6. Tasks
    // -------------------------------------------------------------------------
    BaseType_t rc = xTaskCreate(log_task, "log", 512,
                                reinterpret_cast<void*>(&uart_sink), 1, nullptr);
    configASSERT(rc == pdPASS);
    rc = xTaskCreate(blink_task, "blink", 512, &board, 2, nullptr);
    configASSERT(rc == pdPASS);

    vTaskStartScheduler();

    // Only reached if the idle task could not be allocated.
    for (;;) {
    }
}
